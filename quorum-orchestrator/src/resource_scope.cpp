/**
 * @file resource_scope.cpp
 * @brief Implementation of ResourceScope and PassThroughIsolation
 */

#include "resource_scope.hpp"
#include "logger.hpp"

namespace quorum {

PassThroughIsolation::PassThroughIsolation(const IsolationLimits& limits, Logger* logger)
    : limits_(limits), logger_(logger) {
    if (!logger_) {
        logger_ = &Logger::get_instance();
    }
}

void PassThroughIsolation::enter(const std::string& backend_id) {
    logger_->log_isolation(backend_id, true, limits_.memory_limit_mb, limits_.cpu_limit_percent);
}

void PassThroughIsolation::exit(const std::string& backend_id) noexcept {
    try {
        logger_->log_isolation(backend_id, false, limits_.memory_limit_mb, limits_.cpu_limit_percent);
    } catch (const std::exception&) {
        // Logging must not escape a noexcept release
    }
}

ResourceScope::ResourceScope(IsolationPolicy& policy, const std::string& backend_id)
    : policy_(policy), backend_id_(backend_id) {
    policy_.enter(backend_id_);
}

ResourceScope::~ResourceScope() {
    policy_.exit(backend_id_);
}

} // namespace quorum
