#pragma once

#include "config/Config.hpp"
#include "timer/Dispatcher.hpp"
#include "timer/Errors.hpp"
#include "timer/Slot.hpp"
#include "timer/Task.hpp"
#include "util/MpscQueue.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace tickwheel::timer {

/**
 * Hashed timing wheel
 *
 * add_task() only pushes onto a lock-free inbound queue. The scheduling
 * thread moves queued tasks into slots at the start of each tick, so a
 * task's timing is accurate to one tick: it never fires before its delay
 * has elapsed and fires less than one tick (plus dispatch latency) after.
 *
 * Lifecycle: Init -> Started -> Shutdown. The first add_task() or start()
 * launches the scheduling thread; stop() is terminal and returns every task
 * that has not run.
 */
class WheelTimer {
public:
    enum class State { Init, Started, Shutdown };

    using Work = Task::Work;
    using ExceptionHandler = Dispatcher::ExceptionHandler;

    WheelTimer();
    explicit WheelTimer(const config::Config& cfg, ExceptionHandler handler = {});

    // Stops the timer if running; unexecuted tasks are dropped and logged
    ~WheelTimer();

    WheelTimer(const WheelTimer&) = delete;
    WheelTimer& operator=(const WheelTimer&) = delete;

    // Starts the scheduling thread if needed and blocks until it is ready.
    // Throws IllegalStateError once stopped.
    void start();

    // Schedules work to run once after delay. Throws InvalidArgumentError
    // (empty work, negative delay) or SchedulerStoppedError.
    void add_task(Work work, std::chrono::milliseconds delay);

    template <class Rep, class Period>
    void add_task(Work work, std::chrono::duration<Rep, Period> delay) {
        if (delay < std::chrono::duration<Rep, Period>::zero()) {
            throw InvalidArgumentError("WheelTimer: delay must be >= 0");
        }
        // Delays beyond the millisecond range saturate instead of overflowing
        using WideMillis = std::chrono::duration<long double, std::milli>;
        constexpr auto longest = std::chrono::milliseconds::max();
        if (std::chrono::duration_cast<WideMillis>(delay) >= WideMillis(longest)) {
            add_task(std::move(work), longest);
            return;
        }
        add_task(std::move(work), std::chrono::ceil<std::chrono::milliseconds>(delay));
    }

    // Shuts the timer down and returns the tasks still queued, resident in a
    // slot, or waiting in the dispatcher. Empty when never started or already
    // stopped. Throws IllegalStateError if called from inside a task.
    [[nodiscard]] std::vector<Task> stop();

    [[nodiscard]] State state() const { return state_.load(); }
    [[nodiscard]] size_t wheel_size() const { return wheel_.size(); }
    [[nodiscard]] std::chrono::milliseconds tick_duration() const { return tick_duration_; }
    [[nodiscard]] uint64_t current_tick() const { return tick_.load(std::memory_order_relaxed); }

private:
    // Returns false when the timer is already shut down
    bool ensure_started();
    void launch_worker();

    // Scheduling thread
    void run(std::stop_token stop_token);
    void transfer_tasks();
    void place(Task task);
    void fire_current_slot();
    void wait_for_next_tick(std::stop_token stop_token);
    void collect_unprocessed();

    void wait_for_worker_exit();
    void wait_for_producers() const;

    const std::chrono::milliseconds tick_duration_;
    const size_t transfer_batch_;
    const std::chrono::milliseconds join_poll_interval_;
    const ExceptionHandler handler_;

    // Slots are owned by the scheduling thread once it runs
    std::vector<Slot> wheel_;
    util::MpscQueue<Task> inbound_;

    std::atomic<State> state_{State::Init};
    std::atomic<uint64_t> tick_{0};
    std::atomic<size_t> active_producers_{0};

    // One-shot readiness signal shared by every start() caller
    std::promise<void> ready_promise_;
    std::shared_future<void> ready_;

    std::mutex lifecycle_mutex_;
    std::jthread worker_;
    std::promise<void> worker_exited_promise_;
    std::future<void> worker_exited_;
    std::atomic<std::thread::id> worker_id_{};
    std::atomic<std::thread::id> dispatcher_id_{};

    // Scheduling-thread state
    std::unique_ptr<Dispatcher> dispatcher_;
    std::chrono::steady_clock::time_point start_time_;
    std::mutex sleep_mutex_;
    std::condition_variable_any sleep_cv_;

    // Written by the scheduling thread before it exits, read by stop()
    std::vector<Task> unprocessed_;
};

}  // namespace tickwheel::timer
