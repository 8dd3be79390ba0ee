/**
 * @file backend_executor.cpp
 * @brief Implementation of BackendExecutor
 */

#include "backend_executor.hpp"
#include "deadline_runner.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace quorum {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

bool is_valid_timeout(double timeout_seconds) {
    return std::isfinite(timeout_seconds) && timeout_seconds > 0.0;
}

size_t retry_backoff_ms(size_t base_delay_ms, size_t retry_number) {
    if (retry_number == 0 || base_delay_ms == 0) {
        return 0;
    }

    const size_t exponent = std::min<size_t>(retry_number - 1, MAX_BACKOFF_EXPONENT);
    if (base_delay_ms > (MAX_RETRY_BACKOFF_MS >> exponent)) {
        return MAX_RETRY_BACKOFF_MS;
    }
    return std::min(base_delay_ms << exponent, MAX_RETRY_BACKOFF_MS);
}

BackendExecutor::BackendExecutor(
    std::shared_ptr<IBackend> backend,
    const ExecutorConfig& config,
    std::shared_ptr<IsolationPolicy> isolation,
    Logger* logger
)
    : backend_(std::move(backend)),
      config_(config),
      isolation_(std::move(isolation)),
      logger_(logger) {

    if (!backend_) {
        throw std::invalid_argument("BackendExecutor: backend cannot be null");
    }
    if (!logger_) {
        logger_ = &Logger::get_instance();
    }
    if (!isolation_) {
        isolation_ = std::make_shared<PassThroughIsolation>(IsolationLimits(), logger_);
    }
}

Outcome BackendExecutor::execute_query(
    const std::string& query,
    const QueryContext* context,
    std::optional<double> timeout
) {
    const BackendConfig& backend_config = backend_->config();

    if (!backend_config.enabled) {
        Outcome outcome = Outcome::disabled(backend_config.backend_id, "Model is disabled", 0.0);
        record(outcome);
        return outcome;
    }

    double effective_timeout = backend_config.timeout;
    if (timeout) {
        if (is_valid_timeout(*timeout)) {
            effective_timeout = *timeout;
        } else {
            logger_->log_warning(backend_config.backend_id,
                "Ignoring invalid timeout override " + std::to_string(*timeout) +
                "; using configured timeout for backend " + backend_config.backend_id);
        }
    }

    // The worker thread may outlive this call, so it gets its own copy
    std::shared_ptr<const QueryContext> context_copy;
    if (context) {
        context_copy = std::make_shared<const QueryContext>(*context);
    }

    const size_t max_attempts = config_.retry_errors ? backend_config.max_retries + 1 : 1;
    size_t attempt = 0;

    while (true) {
        Outcome outcome = run_attempt(query, context_copy, effective_timeout);
        attempt++;

        if (outcome.status() != OutcomeStatus::ERROR || attempt >= max_attempts) {
            record(outcome);
            logger_->log_outcome(outcome);
            return outcome;
        }

        size_t delay_ms = retry_backoff_ms(config_.retry_delay_ms, attempt);
        logger_->log_warning(backend_config.backend_id,
            "Retrying backend " + backend_config.backend_id + " after error (attempt " +
            std::to_string(attempt + 1) + "/" + std::to_string(max_attempts) + "): " +
            outcome.error_message().value_or(""));
        record_retry();
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
}

Outcome BackendExecutor::run_attempt(
    const std::string& query,
    const std::shared_ptr<const QueryContext>& context,
    double timeout
) {
    const std::string& backend_id = backend_->backend_id();
    const auto attempt_start = std::chrono::steady_clock::now();
    DeadlineRunner runner;

    try {
        ResourceScope scope(*isolation_, backend_id);

        std::shared_ptr<IBackend> backend = backend_;
        std::string content = runner.execute_with_timeout(
            [backend, query, context](const CancellationToken& cancel) {
                return backend->generate_response(query, context.get(), cancel);
            },
            timeout
        );

        double confidence = backend_->get_confidence(query, content);
        if (!std::isfinite(confidence)) {
            throw BackendError("Confidence score is not a finite number");
        }

        return Outcome::success(backend_id, content, confidence, runner.elapsed_seconds());
    } catch (const TimeoutError&) {
        return Outcome::timeout(backend_id, runner.elapsed_seconds());
    } catch (const std::exception& e) {
        return Outcome::error(backend_id, e.what(), seconds_since(attempt_start));
    } catch (...) {
        return Outcome::error(backend_id, "Unknown exception from backend", seconds_since(attempt_start));
    }
}

ExecutorStats BackendExecutor::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void BackendExecutor::reset_stats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = ExecutorStats();
}

void BackendExecutor::record(const Outcome& outcome) {
    std::lock_guard<std::mutex> lock(stats_mutex_);

    switch (outcome.status()) {
        case OutcomeStatus::SUCCESS:
            stats_.successful_runs++;
            break;
        case OutcomeStatus::ERROR:
            stats_.failed_runs++;
            break;
        case OutcomeStatus::TIMEOUT:
            stats_.timeout_count++;
            break;
        case OutcomeStatus::DISABLED:
            stats_.disabled_count++;
            return;
    }

    stats_.total_execution_time_s += outcome.execution_time();
    size_t runs = stats_.successful_runs + stats_.failed_runs + stats_.timeout_count;
    stats_.average_execution_time_s = stats_.total_execution_time_s / static_cast<double>(runs);
}

void BackendExecutor::record_retry() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.retry_count++;
}

} // namespace quorum
