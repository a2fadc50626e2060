#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/** Structured key/value context attached to a log entry. */
using LogFields = std::map<std::string, std::string>;

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and starts the background
 * writer thread. Calling it again switches to the new file.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Default location of the client log file.
 *
 * `ANNEXSYNC_LOG_DIR` wins, then `$XDG_CACHE_HOME/annexsync`, then
 * `~/.cache/annexsync`. The directory is created if missing.
 */
std::string default_log_path();

/**
 * @brief Parse a level name such as "debug" or "WARNING".
 *
 * @param name  Level name, case-insensitive. "error" and "err" both map to
 *              @ref LogLevel::ERR.
 * @param level Receives the parsed level on success.
 * @return `true` if @p name was recognised.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Emit entries as JSON objects instead of plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated files through zlib.
 */
void set_log_compression(bool enable);

bool logger_initialized();

void log_event(LogLevel level, const std::string& message);
void log_event(LogLevel level, const std::string& message, const std::string& data);
void log_event(LogLevel level, const std::string& message, const LogFields& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::string& data);
void log_debug(const std::string& msg, const LogFields& fields);

void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::string& data);
void log_info(const std::string& msg, const LogFields& fields);

void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::string& data);
void log_warning(const std::string& msg, const LogFields& fields);

void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::string& data);
void log_error(const std::string& msg, const LogFields& fields);

/**
 * @brief Record the captured output of a failed external command.
 *
 * Empty streams are skipped so the log only shows what the tool printed.
 */
void log_command_output(const std::string& command, const std::string& out,
                        const std::string& err);

/**
 * @brief Block until queued entries have been written.
 */
void flush_logger();

/**
 * @brief Stop the writer thread and close the log file.
 */
void shutdown_logger();

#endif // LOGGER_HPP
