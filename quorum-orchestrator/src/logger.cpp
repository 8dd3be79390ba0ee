/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace quorum {

namespace {

std::string format_seconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << seconds;
    return oss.str();
}

std::string join_ids(const std::vector<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) joined += ",";
        joined += id;
    }
    return joined;
}

} // namespace

// Never destroyed: abandoned backend workers may still log while static destructors run
Logger& Logger::get_instance() {
    static Logger* instance = new Logger();
    return *instance;
}

Logger::Logger() = default;

Logger::~Logger() = default;

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_backend_registered(const BackendConfig& config) {
    std::map<std::string, std::string> fields;
    fields["event"] = "backend_registered";
    fields["backend_id"] = config.backend_id;
    fields["backend_kind"] = config.backend_kind;
    fields["weight"] = std::to_string(config.weight);
    fields["timeout_s"] = format_seconds(config.timeout);
    fields["max_retries"] = std::to_string(config.max_retries);
    fields["enabled"] = config.enabled ? "true" : "false";

    for (const auto& [key, value] : config.params) {
        fields["param." + key] = value;
    }

    log(LogLevel::INFO, "Registered backend " + config.backend_id, fields);
}

void Logger::log_dispatch_start(const std::string& query, const std::vector<std::string>& candidates) {
    std::map<std::string, std::string> fields;
    fields["event"] = "dispatch_start";
    fields["query"] = preview(query);
    fields["candidate_count"] = std::to_string(candidates.size());
    fields["candidates"] = join_ids(candidates);

    log(LogLevel::INFO, "Executing query on " + std::to_string(candidates.size()) + " backends", fields);
}

void Logger::log_dispatch_complete(size_t outcome_count, double elapsed_seconds) {
    std::map<std::string, std::string> fields;
    fields["event"] = "dispatch_complete";
    fields["outcome_count"] = std::to_string(outcome_count);
    fields["elapsed_s"] = format_seconds(elapsed_seconds);

    log(LogLevel::INFO, "Completed parallel execution", fields);
}

void Logger::log_outcome(const Outcome& outcome) {
    std::map<std::string, std::string> fields;
    fields["event"] = "outcome";
    fields["backend_id"] = outcome.backend_id();
    fields["status"] = status_to_string(outcome.status());
    fields["execution_time_s"] = format_seconds(outcome.execution_time());

    if (outcome.confidence()) {
        fields["confidence"] = std::to_string(*outcome.confidence());
    }
    if (outcome.content()) {
        fields["content_length"] = std::to_string(outcome.content()->size());
    }
    if (outcome.error_message()) {
        fields["error"] = *outcome.error_message();
    }

    LogLevel level = LogLevel::INFO;
    std::string message = "Backend " + outcome.backend_id() + " " + status_to_string(outcome.status());
    switch (outcome.status()) {
        case OutcomeStatus::TIMEOUT:
            level = LogLevel::WARN;
            message = "Backend " + outcome.backend_id() + " timed out after " +
                      format_seconds(outcome.execution_time()) + "s";
            break;
        case OutcomeStatus::ERROR:
            level = LogLevel::ERROR;
            message = "Backend " + outcome.backend_id() + " failed: " + outcome.error_message().value_or("");
            break;
        case OutcomeStatus::SUCCESS:
        case OutcomeStatus::DISABLED:
            break;
    }

    log(level, message, fields);
}

void Logger::log_circuit_opened(const std::string& backend_id, size_t failure_count) {
    std::map<std::string, std::string> fields;
    fields["event"] = "circuit_opened";
    fields["backend_id"] = backend_id;
    fields["failure_count"] = std::to_string(failure_count);

    log(LogLevel::WARN, "Circuit breaker opened for backend " + backend_id + " after " +
        std::to_string(failure_count) + " failures", fields);
}

void Logger::log_circuit_reset(const std::string& backend_id) {
    std::map<std::string, std::string> fields;
    fields["event"] = "circuit_reset";
    fields["backend_id"] = backend_id;

    log(LogLevel::INFO, "Circuit breaker reset for backend " + backend_id, fields);
}

void Logger::log_isolation(
    const std::string& backend_id,
    bool entering,
    size_t memory_limit_mb,
    size_t cpu_limit_percent
) {
    std::map<std::string, std::string> fields;
    fields["event"] = entering ? "isolation_enter" : "isolation_exit";
    fields["backend_id"] = backend_id;
    fields["memory_limit_mb"] = std::to_string(memory_limit_mb);
    fields["cpu_limit_percent"] = std::to_string(cpu_limit_percent);

    log(LogLevel::DEBUG, entering ? "Entering isolation scope" : "Exiting isolation scope", fields);
}

void Logger::log_health_check(const std::string& backend_id, bool healthy) {
    std::map<std::string, std::string> fields;
    fields["event"] = "health_check";
    fields["backend_id"] = backend_id;
    fields["healthy"] = healthy ? "true" : "false";

    log(healthy ? LogLevel::DEBUG : LogLevel::WARN,
        "Backend " + backend_id + " health check: " + (healthy ? "PASS" : "FAIL"), fields);
}

void Logger::log_error(const std::string& backend_id, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    if (!backend_id.empty()) {
        fields["backend_id"] = backend_id;
    }
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, error_message, fields);
}

void Logger::log_warning(const std::string& backend_id, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    if (!backend_id.empty()) {
        fields["backend_id"] = backend_id;
    }

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_info(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        nlohmann::json record = fields;
        record["timestamp"] = get_timestamp();
        record["level"] = level_to_string(level);
        record["message"] = message;
        // Invalid UTF-8 in backend content must not abort logging
        output = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::preview(const std::string& text) const {
    size_t limit;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        limit = config_.max_query_preview;
    }
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + "...";
}

// Caller holds mutex_
void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace quorum
