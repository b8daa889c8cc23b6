#pragma once

#include <QString>

namespace trellis::sync {

/**
 * Append every Qt log message to `path` as
 * `<ISO time> <level> <category> <message>` lines, on top of whatever handler
 * was installed before (stderr by default). An empty path means
 * default_log_file_path(). Returns false if the file cannot be opened; the
 * previous handler stays in place then.
 */
bool install_file_logging(const QString& path = QString{});

/**
 * Restore the handler that was active before install_file_logging() and
 * close the log file.
 */
void remove_file_logging();

// <AppLocalDataLocation>/logs/trellis.log, or empty if there is no such location.
QString default_log_file_path();

// Verbose `SYNC:` traces are only written when TRELLIS_DEBUG_SYNC is set.
bool sync_debug_enabled();

} // namespace trellis::sync
