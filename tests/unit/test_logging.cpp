#include <catch2/catch_test_macros.hpp>
#include "sync/logging.hpp"

#include <QDebug>
#include <QFile>
#include <QStringList>
#include <QTemporaryDir>
#include <QtGlobal>

using namespace trellis::sync;

namespace {

QString read_all(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QString{};
    }
    return QString::fromUtf8(file.readAll());
}

QStringList captured;

void capture(QtMsgType type, const QMessageLogContext&, const QString& msg) {
    if (type == QtWarningMsg) {
        captured << msg;
    }
}

} // namespace

TEST_CASE("File logging appends formatted lines", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath("logs/sync.log");

    REQUIRE(install_file_logging(path));
    qWarning() << "SYNC: cycle failed page=" << "p1";
    qInfo() << "SYNC: shared page";
    remove_file_logging();
    qWarning() << "SYNC: after removal";

    const auto lines = read_all(path).split('\n', Qt::SkipEmptyParts);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].contains(" W "));
    REQUIRE(lines[0].contains("SYNC: cycle failed page="));
    REQUIRE(lines[1].contains(" I "));
    REQUIRE(lines[1].endsWith("SYNC: shared page"));
}

TEST_CASE("File logging reports unusable paths", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QFile blocker(dir.filePath("blocker"));
    REQUIRE(blocker.open(QIODevice::WriteOnly));
    blocker.close();

    captured.clear();
    const auto previous = qInstallMessageHandler(capture);

    // A regular file sits where the log directory should be.
    const bool installed = install_file_logging(dir.filePath("blocker/sync.log"));
    remove_file_logging();
    qInstallMessageHandler(previous);

    REQUIRE_FALSE(installed);
    REQUIRE(captured.size() == 1);
    REQUIRE(captured.front().startsWith("SYNC: cannot create log directory"));
}

TEST_CASE("Sync debug traces follow the environment", "[logging]") {
    qunsetenv("TRELLIS_DEBUG_SYNC");
    REQUIRE_FALSE(sync_debug_enabled());

    qputenv("TRELLIS_DEBUG_SYNC", "1");
    REQUIRE(sync_debug_enabled());
    qunsetenv("TRELLIS_DEBUG_SYNC");
}
