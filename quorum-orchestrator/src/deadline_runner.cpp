/**
 * @file deadline_runner.cpp
 * @brief Timing bookkeeping for DeadlineRunner
 */

#include "deadline_runner.hpp"

namespace quorum {

DeadlineRunner::DeadlineRunner()
    : start_time_(std::chrono::steady_clock::now()),
      elapsed_seconds_(0.0),
      timed_out_(false) {}

void DeadlineRunner::mark_start() {
    start_time_ = std::chrono::steady_clock::now();
    elapsed_seconds_ = 0.0;
    timed_out_ = false;
}

void DeadlineRunner::mark_finished() {
    auto end_time = std::chrono::steady_clock::now();
    elapsed_seconds_ = std::chrono::duration<double>(end_time - start_time_).count();
}

} // namespace quorum
