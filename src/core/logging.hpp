#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(scoutDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(scoutWireLog)
Q_DECLARE_LOGGING_CATEGORY(scoutTransportLog)

namespace scout {

// Installs a Qt message handler that stamps time/level/category on every line
// and writes it to stderr. When `log_file_path` is non-empty the same line is
// appended to that file as well.
void install_message_handler(const QString& log_file_path = {});

// Turns on debug output for every scout.* category.
void enable_debug_logging();

// True when SCOUT_DEBUG_DISCOVERY is set to anything but "0".
[[nodiscard]] bool debug_logging_requested();

} // namespace scout
