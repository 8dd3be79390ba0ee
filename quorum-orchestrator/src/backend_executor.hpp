/**
 * @file backend_executor.hpp
 * @brief Executes queries on one backend with isolation and timeout protection
 *
 * The BackendExecutor handles:
 * - Short-circuiting disabled backends
 * - Entering the resource isolation scope around every attempt
 * - Deadline enforcement through a DeadlineRunner
 * - Confidence scoring of successful responses
 * - Optional retry with exponential backoff on errors
 * - Execution statistics
 *
 * Every exit path produces an Outcome; backend failures never propagate.
 */

#ifndef QUORUM_BACKEND_EXECUTOR_HPP
#define QUORUM_BACKEND_EXECUTOR_HPP

#include "backend_interface.hpp"
#include "resource_scope.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace quorum {

class Logger;

/// Upper bound on a single retry backoff (30s)
constexpr size_t MAX_RETRY_BACKOFF_MS = 30000;

/// Backoff stops doubling after this many retries
constexpr size_t MAX_BACKOFF_EXPONENT = 16;

/**
 * @brief Whether a timeout override is usable (finite and positive)
 */
bool is_valid_timeout(double timeout_seconds);

/**
 * @brief Backoff before retry number @p retry_number (1-based)
 *
 * base_delay_ms doubled (retry_number - 1) times, capped at MAX_RETRY_BACKOFF_MS.
 */
size_t retry_backoff_ms(size_t base_delay_ms, size_t retry_number);

/**
 * @brief Executor configuration
 */
struct ExecutorConfig {
    bool retry_errors;         ///< Retry ERROR outcomes up to BackendConfig::max_retries times (default: off)
    size_t retry_delay_ms;     ///< Base backoff delay; doubles after each retry up to MAX_RETRY_BACKOFF_MS (default: 100ms)

    ExecutorConfig()
        : retry_errors(false),
          retry_delay_ms(100) {}
};

/**
 * @brief Executor statistics
 */
struct ExecutorStats {
    size_t successful_runs;
    size_t failed_runs;
    size_t timeout_count;
    size_t disabled_count;
    size_t retry_count;
    double total_execution_time_s;
    double average_execution_time_s;   ///< Over successful, failed and timed out runs

    ExecutorStats()
        : successful_runs(0), failed_runs(0), timeout_count(0), disabled_count(0),
          retry_count(0), total_execution_time_s(0.0), average_execution_time_s(0.0) {}
};

/**
 * @brief Couples one backend with its isolation scope and deadline runner
 *
 * Usage Example:
 *   @code
 *   BackendFactory factory;
 *   BackendExecutor executor(factory.create_backend(config));
 *
 *   Outcome outcome = executor.execute_query("Explain this join", nullptr, 2.0);
 *   if (outcome.status() == OutcomeStatus::SUCCESS) {
 *       std::cout << *outcome.content() << " (" << *outcome.confidence() << ")" << std::endl;
 *   }
 *   @endcode
 *
 * Thread-safety: execute_query may be called concurrently; each call uses its
 * own DeadlineRunner and statistics are guarded by a mutex.
 */
class BackendExecutor {
public:
    /**
     * @brief Constructor
     *
     * @param backend Backend to execute (shared with in-flight worker threads)
     * @param config Executor configuration (optional)
     * @param isolation Isolation policy (optional, PassThroughIsolation if nullptr)
     * @param logger Logger instance (optional, uses default if nullptr)
     *
     * @throws std::invalid_argument If backend is null
     */
    explicit BackendExecutor(
        std::shared_ptr<IBackend> backend,
        const ExecutorConfig& config = ExecutorConfig(),
        std::shared_ptr<IsolationPolicy> isolation = nullptr,
        Logger* logger = nullptr
    );

    BackendExecutor(const BackendExecutor&) = delete;
    BackendExecutor& operator=(const BackendExecutor&) = delete;

    /**
     * @brief Execute a query on the backend
     *
     * @param query Query text
     * @param context Optional side information (copied; may be nullptr)
     * @param timeout Deadline in seconds; the backend's configured timeout if absent, non-finite or not positive
     *
     * @return DISABLED (zero time, backend untouched) if the backend is disabled,
     *         otherwise SUCCESS, TIMEOUT or ERROR
     */
    Outcome execute_query(
        const std::string& query,
        const QueryContext* context = nullptr,
        std::optional<double> timeout = std::nullopt
    );

    const BackendConfig& backend_config() const { return backend_->config(); }
    const std::string& backend_id() const { return backend_->backend_id(); }
    std::shared_ptr<IBackend> backend() const { return backend_; }

    ExecutorStats get_stats() const;
    void reset_stats();

private:
    std::shared_ptr<IBackend> backend_;
    ExecutorConfig config_;
    std::shared_ptr<IsolationPolicy> isolation_;
    Logger* logger_;

    mutable std::mutex stats_mutex_;
    ExecutorStats stats_;

    Outcome run_attempt(
        const std::string& query,
        const std::shared_ptr<const QueryContext>& context,
        double timeout
    );
    void record(const Outcome& outcome);
    void record_retry();
};

} // namespace quorum

#endif // QUORUM_BACKEND_EXECUTOR_HPP
