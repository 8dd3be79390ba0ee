/**
 * @file circuit_breaker.hpp
 * @brief Per-backend reliability gate with timed recovery
 *
 * Phases are derived from counters rather than stored:
 * - Closed: failure_count < threshold, calls are admitted
 * - Open: failure_count >= threshold and the cooldown since the last failure
 *   has not elapsed, calls are refused
 * - Half-open: the first admission check after the cooldown resets
 *   failure_count to 0 and admits the call
 *
 * Successes decrement the failure count by one (floored at zero), so a single
 * success does not fully clear a troubled backend.
 */

#ifndef QUORUM_CIRCUIT_BREAKER_HPP
#define QUORUM_CIRCUIT_BREAKER_HPP

#include <chrono>
#include <cstddef>
#include <mutex>

namespace quorum {

/**
 * @brief Snapshot of a breaker's counters
 */
struct CircuitBreakerState {
    size_t failure_count;
    std::chrono::steady_clock::time_point last_failure_time;   ///< Epoch if never failed

    CircuitBreakerState() : failure_count(0), last_failure_time() {}
};

/**
 * @brief Thread-safe counter-based circuit breaker
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param threshold Failures at which the circuit opens (default: 5)
     * @param cooldown Time after the last failure before the circuit resets (default: 60s)
     */
    explicit CircuitBreaker(
        size_t threshold = 5,
        std::chrono::duration<double> cooldown = std::chrono::seconds(60)
    );

    /**
     * @brief Admission check
     *
     * @param[out] was_reset Set to true if this call reset an expired open circuit
     * @return true if the circuit is open and the call must be refused
     */
    bool is_open(bool* was_reset = nullptr);

    /**
     * @brief Record a failed attempt
     *
     * @return true if this failure made the count reach the threshold
     */
    bool record_failure();

    /**
     * @brief Record a successful attempt (decrements the failure count)
     */
    void record_success();

    CircuitBreakerState state() const;

    size_t threshold() const { return threshold_; }
    std::chrono::duration<double> cooldown() const { return cooldown_; }

private:
    const size_t threshold_;
    const std::chrono::duration<double> cooldown_;

    mutable std::mutex mutex_;
    CircuitBreakerState state_;
};

} // namespace quorum

#endif // QUORUM_CIRCUIT_BREAKER_HPP
