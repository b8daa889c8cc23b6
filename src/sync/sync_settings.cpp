#include "sync/sync_settings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

#include <algorithm>

namespace trellis::sync {
namespace {

constexpr const char* kSettingsDebounceMs = "sync/debounce_ms";
constexpr const char* kSettingsDatabasePath = "sync/database_path";
constexpr const char* kSettingsGraphName = "sync/graph_name";
constexpr const char* kEnvDebounceMs = "TRELLIS_SYNC_DEBOUNCE_MS";

int clamp_debounce(int value) {
    return std::clamp(value, 0, SyncSettings::kMaxDebounceMs);
}

} // namespace

SyncSettings SyncSettings::load() {
    QSettings settings;
    return load(settings);
}

SyncSettings SyncSettings::load(const QSettings& settings) {
    SyncSettings out;

    bool ok = false;
    const int stored = settings.value(QString::fromLatin1(kSettingsDebounceMs),
                                      kDefaultDebounceMs).toInt(&ok);
    out.debounce_ms = ok ? clamp_debounce(stored) : kDefaultDebounceMs;

    if (qEnvironmentVariableIsSet(kEnvDebounceMs)) {
        bool env_ok = false;
        const int env = qEnvironmentVariableIntValue(kEnvDebounceMs, &env_ok);
        if (env_ok) {
            out.debounce_ms = clamp_debounce(env);
        }
    }

    out.database_path = settings.value(QString::fromLatin1(kSettingsDatabasePath)).toString();
    if (out.database_path.isEmpty()) {
        out.database_path = default_database_path();
    }

    const auto graph = settings.value(QString::fromLatin1(kSettingsGraphName)).toString().trimmed();
    if (!graph.isEmpty()) {
        out.graph_name = graph;
    }
    return out;
}

void SyncSettings::save(QSettings& settings) const {
    settings.setValue(QString::fromLatin1(kSettingsDebounceMs), debounce_ms);
    settings.setValue(QString::fromLatin1(kSettingsDatabasePath), database_path);
    settings.setValue(QString::fromLatin1(kSettingsGraphName), graph_name);
}

QString SyncSettings::default_database_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QStringLiteral("trellis.db");
    }
    return QDir(base).filePath(QStringLiteral("trellis.db"));
}

} // namespace trellis::sync
