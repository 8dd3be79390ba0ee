/**
 * @file logger.hpp
 * @brief Structured logging for the orchestrator with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output (one object per line) or plain text
 * - Domain events for registration, dispatch, outcomes and circuit breaker changes
 * - Serialized writes, since backend tasks log concurrently
 *
 * Design Pattern: Process-wide default instance, injectable per orchestrator
 */

#ifndef QUORUM_LOGGER_HPP
#define QUORUM_LOGGER_HPP

#include "backend_interface.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace quorum {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Isolation scope enter/exit, per-task details
    INFO,    ///< Registration, dispatch start/end, circuit resets
    WARN,    ///< Timeouts, circuit opened, empty candidate pool
    ERROR    ///< Backend failures, task failures
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse log level from string (defaults to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)
    size_t max_query_preview;        ///< Characters of query text kept in dispatch events

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("quorum.log"),
          enable_json(true),
          max_query_preview(120) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "quorum.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   logger.log_backend_registered(backend_config);
 *   logger.log_outcome(Outcome::timeout("analyst", 2.0));
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get the process-wide logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Reopens the log file when file output is enabled.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log backend registration with its configuration
     */
    void log_backend_registered(const BackendConfig& config);

    /**
     * @brief Log the start of a parallel dispatch
     *
     * @param query Query text (truncated to max_query_preview)
     * @param candidates Backend IDs selected for dispatch, in dispatch order
     */
    void log_dispatch_start(const std::string& query, const std::vector<std::string>& candidates);

    /**
     * @brief Log the end of a parallel dispatch
     *
     * @param outcome_count Number of outcomes returned
     * @param elapsed_seconds Wall-clock time of the whole fan-out
     */
    void log_dispatch_complete(size_t outcome_count, double elapsed_seconds);

    /**
     * @brief Log a single backend outcome
     *
     * Level follows the status: SUCCESS and DISABLED at INFO, TIMEOUT at WARN,
     * ERROR at ERROR.
     */
    void log_outcome(const Outcome& outcome);

    /**
     * @brief Log a circuit breaker crossing its failure threshold
     */
    void log_circuit_opened(const std::string& backend_id, size_t failure_count);

    /**
     * @brief Log a circuit breaker reset after its cooldown
     */
    void log_circuit_reset(const std::string& backend_id);

    /**
     * @brief Log entering or leaving a resource isolation scope
     *
     * @param backend_id Backend being isolated
     * @param entering true on enter, false on exit
     * @param memory_limit_mb Configured memory quota
     * @param cpu_limit_percent Configured CPU quota
     */
    void log_isolation(
        const std::string& backend_id,
        bool entering,
        size_t memory_limit_mb,
        size_t cpu_limit_percent
    );

    /**
     * @brief Log a health check result
     */
    void log_health_check(const std::string& backend_id, bool healthy);

    /**
     * @brief Log error with backend context
     */
    void log_error(const std::string& backend_id, const std::string& error_message);

    /**
     * @brief Log warning with backend context (backend_id may be empty)
     */
    void log_warning(const std::string& backend_id, const std::string& warning_message);

    /**
     * @brief Log an informational message with arbitrary fields
     */
    void log_info(const std::string& message, const std::map<std::string, std::string>& fields = {});

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string preview(const std::string& text) const;
    void write_output(const std::string& output);
};

} // namespace quorum

#endif // QUORUM_LOGGER_HPP
