#include "timer/WheelTimer.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <limits>
#include <system_error>

namespace tickwheel::timer {

namespace {

using Clock = std::chrono::steady_clock;

// Counts add_task() calls between their state check and their push
class ProducerScope {
public:
    explicit ProducerScope(std::atomic<size_t>& count) : count_(count) { count_.fetch_add(1); }
    ~ProducerScope() { count_.fetch_sub(1); }

    ProducerScope(const ProducerScope&) = delete;
    ProducerScope& operator=(const ProducerScope&) = delete;

private:
    std::atomic<size_t>& count_;
};

}  // namespace

WheelTimer::WheelTimer() : WheelTimer(config::Config{}) {}

WheelTimer::WheelTimer(const config::Config& cfg, ExceptionHandler handler)
    : tick_duration_(cfg.tick_duration),
      transfer_batch_(cfg.transfer_batch),
      join_poll_interval_(cfg.join_poll_interval),
      handler_(std::move(handler)),
      ready_(ready_promise_.get_future().share()),
      worker_exited_(worker_exited_promise_.get_future()) {
    config::ConfigLoader::validate(cfg);
    wheel_.resize(cfg.wheel_size);
}

WheelTimer::~WheelTimer() {
    try {
        auto dropped = stop();
        if (!dropped.empty()) {
            util::Logger::warn("WheelTimer: Destroyed with " + std::to_string(dropped.size()) +
                               " unexecuted tasks, dropping them");
        }
    } catch (const std::exception& e) {
        util::Logger::error(std::string("WheelTimer: Shutdown during destruction failed: ") + e.what());
    }
}

void WheelTimer::start() {
    if (!ensure_started()) {
        throw IllegalStateError("WheelTimer: cannot be started once stopped");
    }
}

void WheelTimer::add_task(Work work, std::chrono::milliseconds delay) {
    Task task(std::move(work), delay);

    if (!ensure_started()) {
        throw SchedulerStoppedError("WheelTimer: cannot add tasks once stopped");
    }

    ProducerScope scope(active_producers_);
    if (state_.load() != State::Started) {
        throw SchedulerStoppedError("WheelTimer: cannot add tasks once stopped");
    }
    inbound_.push(std::move(task));
}

std::vector<Task> WheelTimer::stop() {
    const auto self = std::this_thread::get_id();
    if (self == worker_id_.load() || self == dispatcher_id_.load()) {
        throw IllegalStateError("WheelTimer: stop() cannot be called from a timer task");
    }

    State expected = State::Started;
    if (!state_.compare_exchange_strong(expected, State::Shutdown)) {
        return {};
    }
    util::Logger::info("WheelTimer: Stopping at tick " + std::to_string(current_tick()));

    // A concurrent start() may still be launching the scheduling thread
    ready_.wait();

    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (worker_.joinable()) {
            worker_.request_stop();
            wait_for_worker_exit();
            worker_.join();
        }
    }

    wait_for_producers();

    std::vector<Task> unexecuted = std::move(unprocessed_);
    unprocessed_.clear();
    while (auto task = inbound_.try_pop()) {
        unexecuted.push_back(std::move(*task));
    }

    util::Logger::info("WheelTimer: Stopped, " + std::to_string(unexecuted.size()) + " tasks unexecuted");
    return unexecuted;
}

bool WheelTimer::ensure_started() {
    switch (state_.load()) {
        case State::Init: {
            State expected = State::Init;
            if (state_.compare_exchange_strong(expected, State::Started)) {
                launch_worker();
            } else if (expected == State::Shutdown) {
                return false;
            }
            break;
        }
        case State::Started:
            break;
        case State::Shutdown:
            return false;
    }

    // Every caller blocks here until the scheduling thread is ready.
    // Rethrows the error if the thread could not be started.
    ready_.get();
    return true;
}

void WheelTimer::launch_worker() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    try {
        worker_ = std::jthread([this](std::stop_token st) {
            run(st);
        });
    } catch (const std::system_error& e) {
        util::Logger::error(std::string("WheelTimer: Failed to start scheduling thread: ") + e.what());
        state_.store(State::Shutdown);
        ready_promise_.set_exception(std::current_exception());
        throw;
    }
}

void WheelTimer::run(std::stop_token stop_token) {
    worker_id_.store(std::this_thread::get_id());

    try {
        dispatcher_ = std::make_unique<Dispatcher>(handler_, join_poll_interval_);
        dispatcher_->start();
    } catch (const std::exception& e) {
        util::Logger::error(std::string("WheelTimer: Failed to start dispatcher: ") + e.what());
        state_.store(State::Shutdown);
        ready_promise_.set_exception(std::current_exception());
        worker_exited_promise_.set_value();
        return;
    }
    dispatcher_id_.store(dispatcher_->thread_id());

    start_time_ = Clock::now();
    util::Logger::info("WheelTimer: Started (" + std::to_string(wheel_.size()) + " slots x " +
                       std::to_string(tick_duration_.count()) + "ms)");
    ready_promise_.set_value();

    while (state_.load() == State::Started && !stop_token.stop_requested()) {
        try {
            transfer_tasks();
        } catch (const std::exception& e) {
            util::Logger::error("WheelTimer: Transfer at tick " + std::to_string(current_tick()) +
                                " failed: " + e.what());
        }

        try {
            fire_current_slot();
        } catch (const std::exception& e) {
            util::Logger::error("WheelTimer: Dispatch at tick " + std::to_string(current_tick()) +
                                " failed: " + e.what());
        }

        wait_for_next_tick(stop_token);
        tick_.fetch_add(1, std::memory_order_relaxed);
    }

    collect_unprocessed();
    worker_exited_promise_.set_value();
}

void WheelTimer::transfer_tasks() {
    // Bounded so a burst of submissions cannot stall the wheel
    size_t moved = 0;
    while (moved < transfer_batch_) {
        auto task = inbound_.try_pop();
        if (!task) break;
        place(std::move(*task));
        ++moved;
    }

    if (moved > 0) {
        util::Logger::debug("WheelTimer: Tick " + std::to_string(current_tick()) + " moved " +
                            std::to_string(moved) + " tasks into the wheel");
    }
}

void WheelTimer::place(Task task) {
    using std::chrono::milliseconds;

    const uint64_t current = current_tick();
    const int64_t tick_ms = tick_duration_.count();

    // Deadline in whole milliseconds since start_time_, computed without a
    // time_point so delays past the clock's range cannot wrap. Submission
    // offset rounds up and the sum saturates.
    const int64_t offset_ms =
        std::chrono::ceil<milliseconds>(task.submitted_at() - start_time_).count();
    const int64_t delay_ms = task.delay().count();
    int64_t deadline_ms = std::numeric_limits<int64_t>::max();
    if (offset_ms <= 0 || delay_ms <= deadline_ms - offset_ms) {
        deadline_ms = offset_ms + delay_ms;
    }

    // Round up so the task is never due before its deadline; a deadline
    // already behind the wheel fires on the current tick
    uint64_t due = current;
    if (deadline_ms > 0) {
        const auto ticks = static_cast<uint64_t>(deadline_ms / tick_ms + (deadline_ms % tick_ms != 0 ? 1 : 0));
        due = std::max(due, ticks);
    }

    const uint64_t size = wheel_.size();
    task.set_remaining_rounds(static_cast<int64_t>((due - current) / size));
    wheel_[due % size].add(std::move(task));
}

void WheelTimer::fire_current_slot() {
    auto& slot = wheel_[current_tick() % wheel_.size()];
    if (slot.empty()) return;

    const size_t fired = slot.fire_due(*dispatcher_);
    if (fired > 0) {
        util::Logger::debug("WheelTimer: Tick " + std::to_string(current_tick()) + " dispatched " +
                            std::to_string(fired) + " tasks");
    }
}

void WheelTimer::wait_for_next_tick(std::stop_token stop_token) {
    // Absolute deadline so slow ticks do not accumulate drift
    const auto ticks_ahead = static_cast<int64_t>(current_tick() + 1);
    const auto headroom =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - start_time_);
    const auto next_tick_at = ticks_ahead > headroom / tick_duration_
                                  ? Clock::time_point::max()
                                  : start_time_ + tick_duration_ * ticks_ahead;

    std::unique_lock<std::mutex> lock(sleep_mutex_);
    sleep_cv_.wait_until(lock, stop_token, next_tick_at, [] { return false; });
}

void WheelTimer::collect_unprocessed() {
    auto pending = dispatcher_->terminate();
    for (auto& task : pending) {
        unprocessed_.push_back(std::move(task));
    }

    size_t resident = 0;
    for (auto& slot : wheel_) {
        auto drained = slot.drain_all();
        resident += drained.size();
        for (auto& task : drained) {
            unprocessed_.push_back(std::move(task));
        }
    }

    util::Logger::debug("WheelTimer: Collected " + std::to_string(pending.size()) + " from dispatcher, " +
                        std::to_string(resident) + " from slots");
}

void WheelTimer::wait_for_worker_exit() {
    while (worker_exited_.wait_for(join_poll_interval_) == std::future_status::timeout) {
        util::Logger::warn("WheelTimer: Scheduling thread still running, waiting another " +
                           std::to_string(join_poll_interval_.count()) + "ms");
        worker_.request_stop();
    }
}

void WheelTimer::wait_for_producers() const {
    while (active_producers_.load() != 0) {
        std::this_thread::yield();
    }
}

}  // namespace tickwheel::timer
