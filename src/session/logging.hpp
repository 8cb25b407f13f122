#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(neetingsQueueLog)
Q_DECLARE_LOGGING_CATEGORY(neetingsBoardLog)
Q_DECLARE_LOGGING_CATEGORY(neetingsCodecLog)

namespace neetings::session {

// Installs a Qt message handler that appends every message to the log file.
// Only warnings and worse are echoed to stderr, so command output stays
// readable; enable_debug_logging() echoes everything.
// An empty path means logs/neetings.log under AppLocalDataLocation.
void install_file_logging(const QString& path = {});

// Restores the previous handler and closes the log file.
void uninstall_file_logging();

// Path of the file the installed handler writes to; empty when none.
QString active_log_file_path();

// Turns on debug output for every neetings.* category.
void enable_debug_logging();

} // namespace neetings::session
