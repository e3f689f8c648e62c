#include "timer/Task.hpp"
#include "timer/Errors.hpp"

namespace tickwheel::timer {

Task::Task(Work work, std::chrono::milliseconds delay)
    : work_(std::move(work)), delay_(delay), submitted_at_(Clock::now()) {
    if (!work_) {
        throw InvalidArgumentError("Task: work must not be empty");
    }
    if (delay_ < std::chrono::milliseconds::zero()) {
        throw InvalidArgumentError("Task: delay must be >= 0, got " + std::to_string(delay_.count()) + "ms");
    }
}

Task::Clock::time_point Task::deadline() const {
    const auto headroom = Clock::time_point::max() - submitted_at_;
    if (delay_ > std::chrono::duration_cast<std::chrono::milliseconds>(headroom)) {
        return Clock::time_point::max();
    }
    return submitted_at_ + delay_;
}

void Task::run() const {
    work_();
}

void Task::decrement_round() {
    if (remaining_rounds_ > 0) {
        --remaining_rounds_;
    }
}

}  // namespace tickwheel::timer
