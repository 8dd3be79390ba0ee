/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation flag shared between a caller and a unit of work
 */

#ifndef QUORUM_CANCELLATION_HPP
#define QUORUM_CANCELLATION_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace quorum {

/// Longest wait handed to a clock-based wait (one year); longer values overflow steady_clock
constexpr double MAX_WAIT_SECONDS = 365.0 * 24.0 * 3600.0;

/**
 * @brief Convert seconds to a wait duration clamped to [0, MAX_WAIT_SECONDS]
 *
 * NaN maps to zero.
 */
inline std::chrono::duration<double> bounded_wait(double seconds) {
    if (!(seconds > 0.0)) {
        return std::chrono::duration<double>(0.0);
    }
    return std::chrono::duration<double>(seconds < MAX_WAIT_SECONDS ? seconds : MAX_WAIT_SECONDS);
}

/**
 * @brief Copyable handle to a shared cancellation flag
 *
 * Copies observe the same flag. Once cancelled, a token stays cancelled.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * @brief Sleep for up to @p duration, waking early on cancellation
     *
     * @return true if the token was cancelled before the duration elapsed
     */
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& duration) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, duration, [this]() { return state_->cancelled; });
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    std::shared_ptr<State> state_;
};

} // namespace quorum

#endif // QUORUM_CANCELLATION_HPP
