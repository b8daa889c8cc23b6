#include "sync/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QDebug>
#include <QtGlobal>

namespace trellis::sync {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct FileSink {
    QMutex mu;
    QFile file;
    QtMessageHandler previous = nullptr;
    bool installed = false;
};

FileSink& sink() {
    static FileSink s{};
    return s;
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    auto& s = sink();
    QtMessageHandler previous = nullptr;
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            const auto line = QStringLiteral("%1 %2 %3 %4\n")
                                  .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs),
                                       QString::fromLatin1(level_tag(type)),
                                       ctx.category ? QString::fromLatin1(ctx.category)
                                                    : QString{},
                                       msg);
            s.file.write(line.toUtf8());
            s.file.flush();
        }
        previous = s.previous;
    }
    if (previous) {
        previous(type, ctx, msg);
    }
}

} // namespace

namespace {

// Opens the sink file under the sink lock; returns the failure text, if any.
QString open_sink(FileSink& s, const QString& target) {
    QMutexLocker lock(&s.mu);
    if (s.file.isOpen()) {
        s.file.close();
    }

    const auto dir = QFileInfo(target).absolutePath();
    if (!QDir(dir).mkpath(QStringLiteral("."))) {
        return QStringLiteral("cannot create log directory ") + dir;
    }
    s.file.setFileName(target);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return QStringLiteral("cannot open log file %1: %2").arg(target, s.file.errorString());
    }

    if (!s.installed) {
        s.previous = qInstallMessageHandler(message_handler);
        s.installed = true;
    }
    return QString{};
}

} // namespace

bool install_file_logging(const QString& path) {
    const auto target = path.isEmpty() ? default_log_file_path() : path;
    if (target.isEmpty()) {
        qWarning() << "SYNC: no writable location for the log file";
        return false;
    }

    const auto failure = open_sink(sink(), target);
    if (!failure.isEmpty()) {
        qWarning().noquote() << "SYNC:" << failure;
        return false;
    }
    return true;
}

void remove_file_logging() {
    auto& s = sink();
    QMutexLocker lock(&s.mu);
    if (!s.installed) {
        return;
    }
    qInstallMessageHandler(s.previous);
    s.previous = nullptr;
    s.installed = false;
    s.file.close();
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/trellis.log"));
}

bool sync_debug_enabled() {
    return qEnvironmentVariableIsSet("TRELLIS_DEBUG_SYNC");
}

} // namespace trellis::sync
