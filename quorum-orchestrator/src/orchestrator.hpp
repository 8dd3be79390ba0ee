/**
 * @file orchestrator.hpp
 * @brief Parallel dispatch of one query to many backends with circuit breaker protection
 *
 * The Orchestrator is responsible for:
 * - Owning the backend registry (backend, executor and breaker per backend ID)
 * - Selecting candidates: enabled backends whose circuit is closed
 * - Dispatching one concurrent task per candidate and joining them all
 * - Isolating failures: one task's exception never affects its siblings
 * - Updating circuit breakers from outcomes (ERROR is a failure; SUCCESS and
 *   TIMEOUT count as successes because a slow backend is still reachable)
 * - Health checks and read-only introspection
 *
 * Orchestrators are independent, caller-owned objects; nothing is global
 * apart from the default Logger sink.
 */

#ifndef QUORUM_ORCHESTRATOR_HPP
#define QUORUM_ORCHESTRATOR_HPP

#include "backend_interface.hpp"
#include "backend_factory.hpp"
#include "backend_executor.hpp"
#include "circuit_breaker.hpp"
#include "resource_scope.hpp"
#include "logger.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quorum {

/**
 * @brief Orchestrator configuration
 */
struct OrchestratorConfig {
    size_t failure_threshold;      ///< Failures before a backend's circuit opens (default: 5)
    double cooldown_seconds;       ///< Time after the last failure before the circuit resets (default: 60s)
    ExecutorConfig executor;       ///< Retry behaviour shared by all executors
    IsolationLimits isolation;     ///< Quotas handed to the default isolation policy

    OrchestratorConfig()
        : failure_threshold(5),
          cooldown_seconds(60.0) {}
};

/**
 * @brief Read-only description of a registered backend
 */
struct BackendInfo {
    std::string backend_kind;
    double weight;
    double timeout;
    bool enabled;
    size_t max_retries;

    BackendInfo() : weight(0.0), timeout(0.0), enabled(false), max_retries(0) {}
};

/**
 * @brief Multi-backend query orchestrator
 *
 * Usage Example:
 *   @code
 *   OrchestratorConfig config;
 *   config.failure_threshold = 5;
 *   config.cooldown_seconds = 60.0;
 *
 *   Orchestrator orchestrator(config);
 *
 *   BackendConfig analyst("analyst", "reference");
 *   analyst.params["response_pattern"] = "analytical";
 *   orchestrator.register_backend(analyst);
 *
 *   BackendConfig skeptic("skeptic", "reference");
 *   skeptic.params["response_pattern"] = "conservative";
 *   orchestrator.register_backend(skeptic);
 *
 *   std::vector<Outcome> outcomes = orchestrator.execute_parallel("Which index helps this query?");
 *   for (const auto& outcome : outcomes) {
 *       if (outcome.is_valid()) {
 *           std::cout << outcome.backend_id() << ": " << *outcome.content() << std::endl;
 *       }
 *   }
 *   @endcode
 *
 * Thread-safety: execute_parallel, health_check_all and the breaker
 * operations may run concurrently. Registration must not race with them.
 */
class Orchestrator {
public:
    /**
     * @brief Constructor
     *
     * @param config Orchestrator configuration (optional)
     * @param logger Logger instance (optional, uses default if nullptr)
     *
     * @throws ConfigurationError If the threshold is zero or the cooldown negative
     */
    explicit Orchestrator(
        const OrchestratorConfig& config = OrchestratorConfig(),
        Logger* logger = nullptr
    );

    virtual ~Orchestrator() = default;

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Register a backend built by the BackendFactory
     *
     * @throws ConfigurationError If the configuration is invalid, the kind is
     *         unknown or the backend ID is already registered
     */
    void register_backend(const BackendConfig& config);

    /**
     * @brief Register a prebuilt backend (configuration taken from the backend)
     *
     * @throws std::invalid_argument If backend is null
     * @throws ConfigurationError If the configuration is invalid or the ID is already registered
     */
    void register_backend(std::shared_ptr<IBackend> backend);

    /**
     * @brief Admission check for a backend
     *
     * The first check after the cooldown resets the failure count and admits
     * the backend again.
     *
     * @throws std::out_of_range If the backend is not registered
     */
    bool is_circuit_open(const std::string& backend_id);

    /**
     * @brief Record a failed attempt for a backend
     *
     * @throws std::out_of_range If the backend is not registered
     */
    void record_failure(const std::string& backend_id);

    /**
     * @brief Record a successful attempt for a backend
     *
     * @throws std::out_of_range If the backend is not registered
     */
    void record_success(const std::string& backend_id);

    /**
     * @brief Execute a query on every eligible backend in parallel
     *
     * @param query Query text
     * @param context Optional side information passed to every backend
     * @param timeout Deadline overriding every backend's configured timeout (ignored if non-finite or not positive)
     *
     * @return One outcome per attempted backend, in registration order.
     *         Backends skipped because they are disabled or circuit-open have
     *         no entry; the result is empty when no backend is eligible.
     */
    std::vector<Outcome> execute_parallel(
        const std::string& query,
        const QueryContext* context = nullptr,
        std::optional<double> timeout = std::nullopt
    );

    /**
     * @brief Run health_check() on every registered backend
     *
     * @return Map of backend_id -> healthy (exceptions count as unhealthy)
     */
    std::map<std::string, bool> health_check_all();

    /**
     * @brief Snapshot of each backend's kind, weight, timeout, enabled flag and retry budget
     */
    std::map<std::string, BackendInfo> describe_backends() const;

    /**
     * @brief Snapshot of a backend's breaker counters
     *
     * @throws std::out_of_range If the backend is not registered
     */
    CircuitBreakerState circuit_state(const std::string& backend_id) const;

    /**
     * @brief Executor statistics per backend
     */
    std::map<std::string, ExecutorStats> get_backend_stats() const;

    /// Registered backend IDs in registration (dispatch) order
    const std::vector<std::string>& backend_ids() const { return registration_order_; }

    bool has_backend(const std::string& backend_id) const;
    size_t size() const { return registration_order_.size(); }

    const OrchestratorConfig& config() const { return config_; }

protected:
    /**
     * @brief Runs one candidate's task inside execute_parallel
     *
     * Called concurrently from dispatch threads. An exception escaping here is
     * turned into an ERROR outcome and counted against the backend's breaker.
     */
    virtual Outcome run_task(
        BackendExecutor& executor,
        const std::string& query,
        const QueryContext* context,
        std::optional<double> timeout
    );

private:
    struct BackendEntry {
        std::shared_ptr<IBackend> backend;
        std::unique_ptr<BackendExecutor> executor;
        std::unique_ptr<CircuitBreaker> breaker;
    };

    OrchestratorConfig config_;
    Logger* logger_;
    BackendFactory factory_;
    std::shared_ptr<IsolationPolicy> isolation_;

    std::vector<std::string> registration_order_;
    std::map<std::string, BackendEntry> backends_;

    void add_entry(std::shared_ptr<IBackend> backend);
    BackendEntry& find_entry(const std::string& backend_id);
    const BackendEntry& find_entry(const std::string& backend_id) const;
    void apply_outcome(const Outcome& outcome);
};

} // namespace quorum

#endif // QUORUM_ORCHESTRATOR_HPP
