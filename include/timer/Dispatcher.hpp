#pragma once

#include "timer/Errors.hpp"
#include "timer/Task.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace tickwheel::timer {

// Execution thread for due tasks.
// The scheduling thread only ever enqueues here, so a slow or throwing task
// delays other due tasks but never the advancement of the wheel.
class Dispatcher {
public:
    using ExceptionHandler = std::function<void(const Task&, const TaskExecutionError&)>;

    // An empty handler selects the default one, which logs at Error level
    explicit Dispatcher(ExceptionHandler handler = {},
                        std::chrono::milliseconds join_poll_interval = std::chrono::milliseconds(100));

    // Terminates the thread if still running; queued tasks are discarded
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Launches the execution thread. Calling twice is a no-op.
    void start();

    // Non-blocking hand-off. Throws IllegalStateError once terminated, in
    // which case task is left untouched with the caller.
    void submit(Task&& task);

    // Stops accepting work, wakes the thread, waits for it to finish the task
    // it may be running, and returns every task accepted but not executed.
    // Safe to call on a dispatcher that was never started.
    [[nodiscard]] std::vector<Task> terminate();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] std::thread::id thread_id() const;
    [[nodiscard]] size_t queue_size() const;
    [[nodiscard]] size_t executed_count() const { return executed_.load(std::memory_order_relaxed); }
    [[nodiscard]] size_t failed_count() const { return failed_.load(std::memory_order_relaxed); }

private:
    void run(std::stop_token stop_token);
    void execute(const Task& task);
    void report(const Task& task, const TaskExecutionError& error);

    static void log_failure(const Task& task, const TaskExecutionError& error);

    ExceptionHandler handler_;
    std::chrono::milliseconds join_poll_interval_;

    std::jthread thread_;
    std::promise<void> exited_promise_;
    std::future<void> exited_;

    // Job queue with mutex
    std::deque<Task> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;

    std::atomic<bool> started_{false};
    std::atomic<bool> terminated_{false};
    std::atomic<size_t> executed_{0};
    std::atomic<size_t> failed_{0};
};

}  // namespace tickwheel::timer
