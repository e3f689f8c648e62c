#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace tickwheel::timer {

// A unit of delayed work. Created by WheelTimer::add_task, owned by the
// inbound queue, then by exactly one Slot, then by the Dispatcher.
class Task {
public:
    using Work = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    // Throws InvalidArgumentError on empty work or negative delay
    Task(Work work, std::chrono::milliseconds delay);

    // Runs the work on the calling thread; exceptions propagate
    void run() const;

    [[nodiscard]] const Work& work() const { return work_; }
    [[nodiscard]] std::chrono::milliseconds delay() const { return delay_; }
    [[nodiscard]] Clock::time_point submitted_at() const { return submitted_at_; }
    // Saturates at Clock::time_point::max() for delays past the clock's range
    [[nodiscard]] Clock::time_point deadline() const;

    // Full wheel revolutions left before the task is due
    [[nodiscard]] int64_t remaining_rounds() const { return remaining_rounds_; }
    void set_remaining_rounds(int64_t rounds) { remaining_rounds_ = rounds; }
    void decrement_round();

private:
    Work work_;
    std::chrono::milliseconds delay_;
    Clock::time_point submitted_at_;
    int64_t remaining_rounds_ = 0;
};

}  // namespace tickwheel::timer
