#pragma once

#include <QString>

class QSettings;

namespace trellis::sync {

/**
 * SyncSettings - Tunables of the page sync layer.
 *
 * Read from QSettings under `sync/`; `TRELLIS_SYNC_DEBOUNCE_MS` overrides the
 * stored debounce for test runs and benchmarks.
 */
struct SyncSettings {
    static constexpr int kDefaultDebounceMs = 1000;
    static constexpr int kMaxDebounceMs = 60000;

    int debounce_ms = kDefaultDebounceMs;
    QString database_path;
    QString graph_name = QStringLiteral("null");

    /**
     * Load from the application's default QSettings.
     */
    [[nodiscard]] static SyncSettings load();

    [[nodiscard]] static SyncSettings load(const QSettings& settings);

    void save(QSettings& settings) const;

    [[nodiscard]] static QString default_database_path();
};

} // namespace trellis::sync
