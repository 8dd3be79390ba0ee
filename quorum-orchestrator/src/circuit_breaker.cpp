/**
 * @file circuit_breaker.cpp
 * @brief Implementation of CircuitBreaker
 */

#include "circuit_breaker.hpp"
#include <stdexcept>

namespace quorum {

CircuitBreaker::CircuitBreaker(size_t threshold, std::chrono::duration<double> cooldown)
    : threshold_(threshold), cooldown_(cooldown) {
    if (threshold_ == 0) {
        throw std::invalid_argument("CircuitBreaker: threshold must be at least 1");
    }
    if (cooldown_.count() < 0.0) {
        throw std::invalid_argument("CircuitBreaker: cooldown cannot be negative");
    }
}

bool CircuitBreaker::is_open(bool* was_reset) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (was_reset) {
        *was_reset = false;
    }

    if (state_.failure_count < threshold_) {
        return false;
    }

    if (Clock::now() - state_.last_failure_time < cooldown_) {
        return true;
    }

    state_.failure_count = 0;
    if (was_reset) {
        *was_reset = true;
    }
    return false;
}

bool CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.failure_count++;
    state_.last_failure_time = Clock::now();
    return state_.failure_count == threshold_;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.failure_count > 0) {
        state_.failure_count--;
    }
}

CircuitBreakerState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace quorum
