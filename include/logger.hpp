#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and starts the background
 * writer thread. Calling it again switches to the new file; messages that
 * are still queued are written to the new target.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/** @brief Current minimum log level. */
LogLevel log_level();

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/** @brief Gzip rotated log files when @p enable is `true`. */
void set_log_compression(bool enable);

/** @return `true` if a log file is currently open. */
bool logger_initialized();

/**
 * @brief Parse a level name such as "debug" or "WARN".
 *
 * @param name  Case-insensitive level name.
 * @param level Receives the parsed level on success.
 * @return `false` when @p name is not a known level.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Log a message with the specified severity.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 */
void log_event(LogLevel level, const std::string& message);

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values providing structured context.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Mirror log entries to syslog using the given facility.
 *
 * @param facility Syslog facility identifier (e.g. `LOG_USER`).
 */
void init_syslog(int facility);

/** @brief Block until every queued message has been written. */
void flush_logger();

/**
 * @brief Stop the writer thread, drain the queue and close the log file.
 */
void shutdown_logger();

#endif // LOGGER_HPP
