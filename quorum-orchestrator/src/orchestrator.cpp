/**
 * @file orchestrator.cpp
 * @brief Implementation of Orchestrator
 */

#include "orchestrator.hpp"
#include <chrono>
#include <future>
#include <stdexcept>
#include <system_error>

namespace quorum {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

Orchestrator::Orchestrator(const OrchestratorConfig& config, Logger* logger)
    : config_(config),
      logger_(logger) {

    if (!logger_) {
        logger_ = &Logger::get_instance();
    }

    if (config_.failure_threshold == 0) {
        throw ConfigurationError("failure_threshold must be at least 1");
    }
    if (config_.cooldown_seconds < 0.0) {
        throw ConfigurationError("cooldown_seconds cannot be negative, got " +
                                 std::to_string(config_.cooldown_seconds));
    }

    isolation_ = std::make_shared<PassThroughIsolation>(config_.isolation, logger_);
}

void Orchestrator::register_backend(const BackendConfig& config) {
    validate_backend_config(config);
    if (has_backend(config.backend_id)) {
        throw ConfigurationError("Backend already registered: " + config.backend_id);
    }
    add_entry(factory_.create_backend(config));
}

void Orchestrator::register_backend(std::shared_ptr<IBackend> backend) {
    if (!backend) {
        throw std::invalid_argument("Orchestrator: backend cannot be null");
    }
    validate_backend_config(backend->config());
    if (has_backend(backend->backend_id())) {
        throw ConfigurationError("Backend already registered: " + backend->backend_id());
    }
    add_entry(std::move(backend));
}

void Orchestrator::add_entry(std::shared_ptr<IBackend> backend) {
    const BackendConfig& backend_config = backend->config();

    BackendEntry entry;
    entry.backend = backend;
    entry.executor = std::make_unique<BackendExecutor>(backend, config_.executor, isolation_, logger_);
    entry.breaker = std::make_unique<CircuitBreaker>(
        config_.failure_threshold,
        std::chrono::duration<double>(config_.cooldown_seconds)
    );

    backends_.emplace(backend_config.backend_id, std::move(entry));
    registration_order_.push_back(backend_config.backend_id);

    logger_->log_backend_registered(backend_config);
}

bool Orchestrator::is_circuit_open(const std::string& backend_id) {
    bool was_reset = false;
    bool open = find_entry(backend_id).breaker->is_open(&was_reset);
    if (was_reset) {
        logger_->log_circuit_reset(backend_id);
    }
    return open;
}

void Orchestrator::record_failure(const std::string& backend_id) {
    BackendEntry& entry = find_entry(backend_id);
    if (entry.breaker->record_failure()) {
        logger_->log_circuit_opened(backend_id, entry.breaker->state().failure_count);
    }
}

void Orchestrator::record_success(const std::string& backend_id) {
    find_entry(backend_id).breaker->record_success();
}

std::vector<Outcome> Orchestrator::execute_parallel(
    const std::string& query,
    const QueryContext* context,
    std::optional<double> timeout
) {
    const auto dispatch_start = std::chrono::steady_clock::now();

    // A bad override is the caller's mistake; it must not reach backend breakers
    if (timeout && !is_valid_timeout(*timeout)) {
        logger_->log_warning("", "Ignoring invalid timeout override " + std::to_string(*timeout) +
                                 "; using configured backend timeouts");
        timeout.reset();
    }

    std::vector<std::string> candidates;
    for (const auto& backend_id : registration_order_) {
        const BackendEntry& entry = find_entry(backend_id);
        if (!entry.backend->config().enabled) {
            continue;
        }
        if (is_circuit_open(backend_id)) {
            continue;
        }
        candidates.push_back(backend_id);
    }

    if (candidates.empty()) {
        logger_->log_warning("", "No enabled backends available for query execution "
                                 "(circuit breakers may be open)");
        return {};
    }

    logger_->log_dispatch_start(query, candidates);

    struct Task {
        std::string backend_id;
        std::future<Outcome> future;
        std::string launch_error;
    };

    std::vector<Task> tasks;
    tasks.reserve(candidates.size());

    for (const auto& backend_id : candidates) {
        Task task;
        task.backend_id = backend_id;
        BackendExecutor* executor = find_entry(backend_id).executor.get();

        try {
            task.future = std::async(std::launch::async, [this, executor, &query, context, timeout]() {
                return run_task(*executor, query, context, timeout);
            });
        } catch (const std::system_error& e) {
            task.launch_error = e.what();
        }

        tasks.push_back(std::move(task));
    }

    // Join in dispatch order; each join is guarded on its own
    std::vector<Outcome> outcomes;
    outcomes.reserve(tasks.size());

    for (auto& task : tasks) {
        try {
            if (!task.future.valid()) {
                throw QuorumError("Failed to launch task: " + task.launch_error);
            }
            Outcome outcome = task.future.get();
            apply_outcome(outcome);
            outcomes.push_back(outcome);
        } catch (const std::exception& e) {
            logger_->log_error(task.backend_id, "Task for backend " + task.backend_id +
                                                " raised exception: " + e.what());
            record_failure(task.backend_id);
            outcomes.push_back(Outcome::error(task.backend_id, e.what(), seconds_since(dispatch_start)));
        } catch (...) {
            logger_->log_error(task.backend_id, "Task for backend " + task.backend_id +
                                                " raised an unknown exception");
            record_failure(task.backend_id);
            outcomes.push_back(Outcome::error(task.backend_id, "Unknown exception from task",
                                              seconds_since(dispatch_start)));
        }
    }

    logger_->log_dispatch_complete(outcomes.size(), seconds_since(dispatch_start));
    return outcomes;
}

Outcome Orchestrator::run_task(
    BackendExecutor& executor,
    const std::string& query,
    const QueryContext* context,
    std::optional<double> timeout
) {
    return executor.execute_query(query, context, timeout);
}

void Orchestrator::apply_outcome(const Outcome& outcome) {
    switch (outcome.status()) {
        case OutcomeStatus::ERROR:
            record_failure(outcome.backend_id());
            break;
        case OutcomeStatus::SUCCESS:
        case OutcomeStatus::TIMEOUT:
            record_success(outcome.backend_id());
            break;
        case OutcomeStatus::DISABLED:
            break;
    }
}

std::map<std::string, bool> Orchestrator::health_check_all() {
    std::map<std::string, bool> results;

    for (const auto& backend_id : registration_order_) {
        const BackendEntry& entry = find_entry(backend_id);
        bool healthy = false;
        try {
            healthy = entry.backend->health_check();
        } catch (const std::exception& e) {
            logger_->log_error(backend_id, "Health check failed for backend " + backend_id + ": " + e.what());
        } catch (...) {
            logger_->log_error(backend_id, "Health check failed for backend " + backend_id +
                                           ": unknown exception");
        }
        logger_->log_health_check(backend_id, healthy);
        results[backend_id] = healthy;
    }

    return results;
}

std::map<std::string, BackendInfo> Orchestrator::describe_backends() const {
    std::map<std::string, BackendInfo> info;

    for (const auto& [backend_id, entry] : backends_) {
        const BackendConfig& backend_config = entry.backend->config();
        BackendInfo backend_info;
        backend_info.backend_kind = backend_config.backend_kind;
        backend_info.weight = backend_config.weight;
        backend_info.timeout = backend_config.timeout;
        backend_info.enabled = backend_config.enabled;
        backend_info.max_retries = backend_config.max_retries;
        info[backend_id] = backend_info;
    }

    return info;
}

CircuitBreakerState Orchestrator::circuit_state(const std::string& backend_id) const {
    return find_entry(backend_id).breaker->state();
}

std::map<std::string, ExecutorStats> Orchestrator::get_backend_stats() const {
    std::map<std::string, ExecutorStats> stats;
    for (const auto& [backend_id, entry] : backends_) {
        stats[backend_id] = entry.executor->get_stats();
    }
    return stats;
}

bool Orchestrator::has_backend(const std::string& backend_id) const {
    return backends_.find(backend_id) != backends_.end();
}

Orchestrator::BackendEntry& Orchestrator::find_entry(const std::string& backend_id) {
    auto it = backends_.find(backend_id);
    if (it == backends_.end()) {
        throw std::out_of_range("Backend not registered: " + backend_id);
    }
    return it->second;
}

const Orchestrator::BackendEntry& Orchestrator::find_entry(const std::string& backend_id) const {
    auto it = backends_.find(backend_id);
    if (it == backends_.end()) {
        throw std::out_of_range("Backend not registered: " + backend_id);
    }
    return it->second;
}

} // namespace quorum
