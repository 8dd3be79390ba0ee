/**
 * @file backend_interface.cpp
 * @brief Outcome named constructors, configuration validation and default health check
 */

#include "backend_interface.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace quorum {

Outcome::Outcome(const std::string& backend_id, OutcomeStatus status, double execution_time)
    : backend_id_(backend_id),
      status_(status),
      execution_time_(std::max(0.0, execution_time)),
      timestamp_(std::chrono::system_clock::now()) {}

Outcome Outcome::success(
    const std::string& backend_id,
    const std::string& content,
    double confidence,
    double execution_time
) {
    Outcome outcome(backend_id, OutcomeStatus::SUCCESS, execution_time);
    outcome.content_ = content;
    outcome.confidence_ = std::min(1.0, std::max(0.0, confidence));
    return outcome;
}

Outcome Outcome::timeout(const std::string& backend_id, double execution_time) {
    return Outcome(backend_id, OutcomeStatus::TIMEOUT, execution_time);
}

Outcome Outcome::error(
    const std::string& backend_id,
    const std::string& error_message,
    double execution_time
) {
    Outcome outcome(backend_id, OutcomeStatus::ERROR, execution_time);
    outcome.error_message_ = error_message;
    return outcome;
}

Outcome Outcome::disabled(
    const std::string& backend_id,
    const std::string& reason,
    double execution_time
) {
    Outcome outcome(backend_id, OutcomeStatus::DISABLED, execution_time);
    outcome.error_message_ = reason;
    return outcome;
}

bool Outcome::is_valid() const {
    if (status_ != OutcomeStatus::SUCCESS || !content_) {
        return false;
    }
    return std::any_of(content_->begin(), content_->end(), [](unsigned char c) {
        return !std::isspace(c);
    });
}

void validate_backend_config(const BackendConfig& config) {
    if (config.backend_id.empty()) {
        throw ConfigurationError("backend_id cannot be empty");
    }
    if (config.backend_kind.empty()) {
        throw ConfigurationError("Backend '" + config.backend_id + "' has no backend_kind");
    }
    if (!std::isfinite(config.weight) || config.weight < 0.0 || config.weight > 10.0) {
        throw ConfigurationError("Backend '" + config.backend_id +
                                 "' weight must be between 0 and 10, got " +
                                 std::to_string(config.weight));
    }
    if (!std::isfinite(config.timeout) || !(config.timeout > 0.0)) {
        throw ConfigurationError("Backend '" + config.backend_id +
                                 "' timeout must be a positive number, got " +
                                 std::to_string(config.timeout));
    }
}

bool IBackend::health_check() {
    try {
        CancellationToken token;
        std::string response = generate_response("test", nullptr, token);
        return std::any_of(response.begin(), response.end(), [](unsigned char c) {
            return !std::isspace(c);
        });
    } catch (const std::exception& e) {
        Logger::get_instance().log_warning(backend_id(),
            "Health check failed for backend " + backend_id() + ": " + e.what());
        return false;
    } catch (...) {
        Logger::get_instance().log_warning(backend_id(),
            "Health check failed for backend " + backend_id() + ": unknown exception");
        return false;
    }
}

} // namespace quorum
