#pragma once

#include <chrono>

namespace aim {

/// Wall-clock budget of one evaluation task.
class TaskBudget {
public:
    explicit TaskBudget(std::chrono::milliseconds timeout)
        : timeout_(timeout) {}

    void start() { start_time_ = std::chrono::steady_clock::now(); }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    /// Time left before the deadline, zero once exhausted.
    std::chrono::steady_clock::duration remaining() const {
        auto left = (start_time_ + timeout_) - std::chrono::steady_clock::now();
        return left > std::chrono::steady_clock::duration::zero()
                   ? left
                   : std::chrono::steady_clock::duration::zero();
    }

    bool isExhausted() const { return remaining() == std::chrono::steady_clock::duration::zero(); }

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

} // namespace aim
