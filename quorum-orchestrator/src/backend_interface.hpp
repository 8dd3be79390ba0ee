/**
 * @file backend_interface.hpp
 * @brief Abstract interface for pluggable query backends and the shared data model
 *
 * This interface enables the orchestrator to dispatch one query to several
 * heterogeneous backends ("models") and collect a uniform set of outcomes for
 * a downstream consensus layer.
 *
 * Design Principles:
 * - Uniform: every execution attempt produces exactly one Outcome
 * - Isolated: one backend's failure never affects its siblings
 * - Bounded: deadlines are enforced by the caller, not by the backend
 * - Cooperative: backends may observe a CancellationToken to stop early
 */

#ifndef QUORUM_BACKEND_INTERFACE_HPP
#define QUORUM_BACKEND_INTERFACE_HPP

#include "cancellation.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace quorum {

/**
 * @brief Immutable per-backend configuration
 */
struct BackendConfig {
    std::string backend_id;                      ///< Unique key (e.g., "analyst")
    std::string backend_kind;                    ///< Kind discriminator resolved by BackendFactory (e.g., "reference")
    double weight;                               ///< Relative influence for downstream consensus (0-10)
    double timeout;                              ///< Default deadline in seconds
    size_t max_retries;                          ///< Retry budget (used only when ExecutorConfig::retry_errors is set)
    bool enabled;                                ///< Disabled backends are never invoked
    std::map<std::string, std::string> params;   ///< Kind-specific parameters

    BackendConfig()
        : weight(1.0), timeout(30.0), max_retries(2), enabled(true) {}

    BackendConfig(const std::string& id_, const std::string& kind_)
        : backend_id(id_), backend_kind(kind_),
          weight(1.0), timeout(30.0), max_retries(2), enabled(true) {}
};

/**
 * @brief Optional caller-supplied side information passed unchanged to every backend
 */
struct QueryContext {
    std::string query_type;                      ///< Optional classification (e.g., "sql_generation")
    std::map<std::string, std::string> hints;    ///< Free-form hints (e.g., schema summary)

    QueryContext() = default;
    explicit QueryContext(const std::string& type) : query_type(type) {}
};

/**
 * @brief Status of one backend execution attempt
 */
enum class OutcomeStatus {
    SUCCESS,   ///< Backend produced content and a confidence score
    TIMEOUT,   ///< Deadline exceeded
    ERROR,     ///< Backend failed (generation or scoring)
    DISABLED   ///< Backend excluded by configuration
};

/**
 * @brief Convert outcome status to string for logging
 */
inline std::string status_to_string(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::SUCCESS: return "success";
        case OutcomeStatus::TIMEOUT: return "timeout";
        case OutcomeStatus::ERROR: return "error";
        case OutcomeStatus::DISABLED: return "disabled";
    }
    return "unknown";
}

/**
 * @brief Uniform, always well-formed result of one backend execution attempt
 *
 * Outcomes can only be built through the named constructors, so content and
 * confidence exist iff the status is SUCCESS and an error message exists iff
 * the status is ERROR or DISABLED.
 */
class Outcome {
public:
    static Outcome success(
        const std::string& backend_id,
        const std::string& content,
        double confidence,
        double execution_time
    );

    static Outcome timeout(const std::string& backend_id, double execution_time);

    static Outcome error(
        const std::string& backend_id,
        const std::string& error_message,
        double execution_time = 0.0
    );

    static Outcome disabled(
        const std::string& backend_id,
        const std::string& reason = "Model is disabled",
        double execution_time = 0.0
    );

    const std::string& backend_id() const { return backend_id_; }
    OutcomeStatus status() const { return status_; }
    const std::optional<std::string>& content() const { return content_; }
    const std::optional<double>& confidence() const { return confidence_; }
    const std::optional<std::string>& error_message() const { return error_message_; }

    /// Seconds spent on the attempt (always >= 0)
    double execution_time() const { return execution_time_; }

    /// Wall-clock creation time
    std::chrono::system_clock::time_point timestamp() const { return timestamp_; }

    /**
     * @brief Whether the outcome is usable by a consensus layer
     *
     * @return true for SUCCESS with non-blank content
     */
    bool is_valid() const;

private:
    Outcome(const std::string& backend_id, OutcomeStatus status, double execution_time);

    std::string backend_id_;
    OutcomeStatus status_;
    std::optional<std::string> content_;
    std::optional<double> confidence_;
    std::optional<std::string> error_message_;
    double execution_time_;
    std::chrono::system_clock::time_point timestamp_;
};

/**
 * @brief Base exception for orchestrator errors
 */
class QuorumError : public std::runtime_error {
public:
    explicit QuorumError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when backend or orchestrator configuration is invalid
 */
class ConfigurationError : public QuorumError {
public:
    explicit ConfigurationError(const std::string& message)
        : QuorumError("Configuration error: " + message) {}
};

/**
 * @brief Raised by backends when generation or scoring fails
 */
class BackendError : public QuorumError {
public:
    explicit BackendError(const std::string& message)
        : QuorumError(message) {}
};

/**
 * @brief Raised by DeadlineRunner when a unit of work exceeds its deadline
 */
class TimeoutError : public BackendError {
public:
    TimeoutError(const std::string& message, double elapsed_seconds)
        : BackendError(message), elapsed_seconds_(elapsed_seconds) {}

    double elapsed_seconds() const { return elapsed_seconds_; }

private:
    double elapsed_seconds_;
};

/**
 * @brief Raised by backends that stop early after observing cancellation
 */
class CancelledError : public BackendError {
public:
    explicit CancelledError(const std::string& message)
        : BackendError("Cancelled: " + message) {}
};

/**
 * @brief Validate a backend configuration
 *
 * Checks: non-empty id and kind, finite weight in [0, 10], finite positive timeout.
 *
 * @throws ConfigurationError If any field is out of range
 */
void validate_backend_config(const BackendConfig& config);

/**
 * @brief Abstract interface for query backends
 *
 * All backends (reference backend, real model integrations) implement this
 * interface so the orchestrator can fan a query out to them uniformly.
 *
 * Usage Example:
 *   @code
 *   BackendConfig config("analyst", "reference");
 *   config.params["response_pattern"] = "analytical";
 *
 *   std::shared_ptr<IBackend> backend = BackendFactory().create_backend(config);
 *
 *   CancellationToken token;
 *   std::string content = backend->generate_response("Optimize this SQL", nullptr, token);
 *   double confidence = backend->get_confidence("Optimize this SQL", content);
 *   @endcode
 *
 * @note generate_response may be invoked from a worker thread and may still be
 *       running after the caller has given up on it. Implementations must not
 *       rely on the caller's stack. A backend that ignores its CancellationToken
 *       keeps that thread alive until it returns, possibly into process exit;
 *       such code may only touch state it owns or the Logger default instance,
 *       which is never destroyed.
 */
class IBackend {
public:
    explicit IBackend(const BackendConfig& config) : config_(config) {}
    virtual ~IBackend() = default;

    IBackend(const IBackend&) = delete;
    IBackend& operator=(const IBackend&) = delete;

    /**
     * @brief Produce raw content for a query
     *
     * @param query Query text
     * @param context Optional side information (nullptr if absent)
     * @param cancel Raised by the caller once it stops waiting for the result
     *
     * @return Generated content
     *
     * @throws BackendError (or any std::exception) on failure
     */
    virtual std::string generate_response(
        const std::string& query,
        const QueryContext* context,
        const CancellationToken& cancel
    ) = 0;

    /**
     * @brief Score a response
     *
     * @return Confidence in [0, 1]
     */
    virtual double get_confidence(const std::string& query, const std::string& response) = 0;

    /**
     * @brief Check if the backend is reachable and produces output
     *
     * Default implementation generates a response for "test" and reports
     * whether it is non-blank. Never throws.
     */
    virtual bool health_check();

    const BackendConfig& config() const { return config_; }
    const std::string& backend_id() const { return config_.backend_id; }

protected:
    BackendConfig config_;
};

} // namespace quorum

#endif // QUORUM_BACKEND_INTERFACE_HPP
