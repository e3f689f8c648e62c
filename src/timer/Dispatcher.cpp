#include "timer/Dispatcher.hpp"
#include "util/Logger.hpp"
#include <optional>

namespace tickwheel::timer {

Dispatcher::Dispatcher(ExceptionHandler handler, std::chrono::milliseconds join_poll_interval)
    : handler_(std::move(handler)),
      join_poll_interval_(join_poll_interval),
      exited_(exited_promise_.get_future()) {
    if (!handler_) {
        handler_ = &Dispatcher::log_failure;
    }
    if (join_poll_interval_ <= std::chrono::milliseconds::zero()) {
        throw InvalidArgumentError("Dispatcher: join poll interval must be positive");
    }
}

Dispatcher::~Dispatcher() {
    if (!thread_.joinable()) return;

    auto dropped = terminate();
    if (!dropped.empty()) {
        util::Logger::warn("Dispatcher: Destroyed with " + std::to_string(dropped.size()) +
                           " unexecuted tasks");
    }
}

void Dispatcher::start() {
    if (terminated_.load()) {
        throw IllegalStateError("Dispatcher: cannot be started once terminated");
    }
    if (started_.exchange(true)) return;

    thread_ = std::jthread([this](std::stop_token st) {
        run(st);
    });
    util::Logger::info("Dispatcher: Started");
}

void Dispatcher::submit(Task&& task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (terminated_.load()) {
            throw IllegalStateError("Dispatcher: cannot accept tasks once terminated");
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

std::vector<Task> Dispatcher::terminate() {
    terminated_.store(true);

    if (thread_.joinable()) {
        if (std::this_thread::get_id() == thread_.get_id()) {
            throw IllegalStateError("Dispatcher: cannot terminate from its own thread");
        }

        // Wakes the queue wait; a running task is left to finish
        thread_.request_stop();
        while (exited_.wait_for(join_poll_interval_) == std::future_status::timeout) {
            util::Logger::warn("Dispatcher: Still running a task, waiting another " +
                               std::to_string(join_poll_interval_.count()) + "ms");
        }
        thread_.join();
    }

    std::vector<Task> unprocessed;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        unprocessed.reserve(queue_.size());
        for (auto& task : queue_) {
            unprocessed.push_back(std::move(task));
        }
        queue_.clear();
    }

    util::Logger::info("Dispatcher: Terminated (" + std::to_string(executed_count()) + " executed, " +
                       std::to_string(unprocessed.size()) + " unprocessed)");
    return unprocessed;
}

bool Dispatcher::is_running() const {
    return started_.load() && !terminated_.load();
}

std::thread::id Dispatcher::thread_id() const {
    return thread_.get_id();
}

size_t Dispatcher::queue_size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void Dispatcher::run(std::stop_token stop_token) {
    util::Logger::debug("Dispatcher: Worker thread " +
                        std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) +
                        " started");

    while (!stop_token.stop_requested()) {
        std::optional<Task> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            // Wait for a task or stop signal
            cv_.wait(lock, stop_token, [this]() {
                return !queue_.empty();
            });

            // Anything still queued goes back to terminate()
            if (stop_token.stop_requested()) {
                break;
            }

            task.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }

        // Execute outside the lock so submit() never waits on a task
        execute(*task);
    }

    util::Logger::debug("Dispatcher: Worker thread stopped");
    exited_promise_.set_value();
}

void Dispatcher::execute(const Task& task) {
    try {
        task.run();
        executed_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        report(task, TaskExecutionError(std::string("task failed: ") + e.what(), std::current_exception()));
    } catch (...) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        report(task, TaskExecutionError("task failed: non-standard exception", std::current_exception()));
    }
}

void Dispatcher::report(const Task& task, const TaskExecutionError& error) {
    try {
        handler_(task, error);
    } catch (const std::exception& e) {
        util::Logger::error(std::string("Dispatcher: Exception handler threw: ") + e.what() +
                            " (while reporting: " + error.what() + ")");
    } catch (...) {
        util::Logger::error(std::string("Dispatcher: Exception handler threw a non-standard exception") +
                            " (while reporting: " + error.what() + ")");
    }
}

void Dispatcher::log_failure(const Task& task, const TaskExecutionError& error) {
    util::Logger::error("Dispatcher: " + std::string(error.what()) + " (delay " +
                        std::to_string(task.delay().count()) + "ms)");
}

}  // namespace tickwheel::timer
