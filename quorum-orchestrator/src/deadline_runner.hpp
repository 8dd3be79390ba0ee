/**
 * @file deadline_runner.hpp
 * @brief Runs one unit of work against a wall-clock deadline
 *
 * The work runs on its own detached worker thread and the caller waits on a
 * future up to the deadline. On timeout the runner raises the work's
 * CancellationToken and returns immediately; it never joins the abandoned
 * worker, so the caller observes the deadline rather than the work's
 * duration. Anything the work needs must be captured by value (or by
 * shared_ptr), since it may outlive the call. Work that ignores the token
 * keeps its thread until it returns, which can be after main() exits.
 *
 * Elapsed time is recorded on every exit path: success, timeout and failure.
 */

#ifndef QUORUM_DEADLINE_RUNNER_HPP
#define QUORUM_DEADLINE_RUNNER_HPP

#include "backend_interface.hpp"
#include "cancellation.hpp"
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

namespace quorum {

/**
 * @brief Deadline enforcement with elapsed-time measurement
 *
 * Usage Example:
 *   @code
 *   DeadlineRunner runner;
 *   try {
 *       std::string content = runner.execute_with_timeout(
 *           [backend, query](const CancellationToken& cancel) {
 *               return backend->generate_response(query, nullptr, cancel);
 *           },
 *           2.5);
 *   } catch (const TimeoutError& e) {
 *       // runner.elapsed_seconds() is ~2.5
 *   }
 *   @endcode
 *
 * A runner measures one call at a time; use one instance per attempt.
 */
class DeadlineRunner {
public:
    DeadlineRunner();

    /**
     * @brief Execute @p work with a deadline
     *
     * @param work Callable taking `const CancellationToken&` and returning a value
     * @param timeout_seconds Deadline in seconds (must be positive; waits are capped at MAX_WAIT_SECONDS)
     *
     * @return Value returned by @p work
     *
     * @throws std::invalid_argument If timeout_seconds is not positive
     * @throws TimeoutError If the deadline passes first (token is cancelled)
     * @throws Whatever @p work throws, unchanged
     */
    template <typename Work>
    auto execute_with_timeout(Work work, double timeout_seconds)
        -> std::decay_t<decltype(work(std::declval<const CancellationToken&>()))>;

    /// Seconds between the start of the last call and its completion, timeout or failure
    double elapsed_seconds() const { return elapsed_seconds_; }

    /// Whether the last call ended by deadline
    bool timed_out() const { return timed_out_; }

private:
    std::chrono::steady_clock::time_point start_time_;
    double elapsed_seconds_;
    bool timed_out_;

    void mark_start();
    void mark_finished();
};

template <typename Work>
auto DeadlineRunner::execute_with_timeout(Work work, double timeout_seconds)
    -> std::decay_t<decltype(work(std::declval<const CancellationToken&>()))> {
    using Result = std::decay_t<decltype(work(std::declval<const CancellationToken&>()))>;

    if (!(timeout_seconds > 0.0)) {
        throw std::invalid_argument("DeadlineRunner: timeout must be positive, got " +
                                    std::to_string(timeout_seconds));
    }

    mark_start();

    CancellationToken token;
    auto promise = std::make_shared<std::promise<Result>>();
    std::future<Result> future = promise->get_future();

    try {
        std::thread worker([promise, token, work = std::move(work)]() mutable {
            try {
                promise->set_value(work(token));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
        worker.detach();
    } catch (...) {
        mark_finished();
        throw;
    }

    if (future.wait_for(bounded_wait(timeout_seconds)) == std::future_status::timeout) {
        mark_finished();
        timed_out_ = true;
        token.cancel();
        throw TimeoutError("Execution timeout after " + std::to_string(timeout_seconds) + " seconds",
                           elapsed_seconds_);
    }

    try {
        Result result = future.get();
        mark_finished();
        return result;
    } catch (...) {
        mark_finished();
        throw;
    }
}

} // namespace quorum

#endif // QUORUM_DEADLINE_RUNNER_HPP
