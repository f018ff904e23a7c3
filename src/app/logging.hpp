#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lanmailDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(lanmailMessagingLog)
Q_DECLARE_LOGGING_CATEGORY(lanmailNodeLog)

namespace lanmail::app {

// Log files above this size are rotated to "<name>.1" when logging starts.
inline constexpr qint64 kMaxLogFileBytes = 1024 * 1024;

// Routes all Qt messages to `path` (default_log_file_path() when empty) as
// "<utc time> <level> <category> <message>" lines, echoing each to stderr.
void install_file_logging(const QString& path = {});

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Formats one log line, without the trailing newline.
QString format_log_line(QtMsgType type, const char* category, const QString& message);

// Turns on debug output for the given categories.
void enable_debug_categories(bool discovery, bool messaging);

} // namespace lanmail::app
