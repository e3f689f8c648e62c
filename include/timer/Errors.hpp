#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace tickwheel::timer {

// Caller passed empty work, a negative delay, or an unusable configuration
class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& msg) : std::invalid_argument(msg) {}
};

class IllegalStateError : public std::logic_error {
public:
    explicit IllegalStateError(const std::string& msg) : std::logic_error(msg) {}
};

// add_task() after the scheduler has been stopped
class SchedulerStoppedError : public IllegalStateError {
public:
    explicit SchedulerStoppedError(const std::string& msg) : IllegalStateError(msg) {}
};

// Built by the dispatcher when a task body throws. Only ever handed to the
// exception handler; it never leaves the dispatcher thread.
class TaskExecutionError : public std::runtime_error {
public:
    TaskExecutionError(const std::string& msg, std::exception_ptr cause)
        : std::runtime_error(msg), cause_(std::move(cause)) {}

    [[nodiscard]] std::exception_ptr cause() const { return cause_; }

private:
    std::exception_ptr cause_;
};

}  // namespace tickwheel::timer
