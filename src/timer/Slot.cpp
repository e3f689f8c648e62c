#include "timer/Slot.hpp"
#include "timer/Dispatcher.hpp"
#include <utility>

namespace tickwheel::timer {

void Slot::add(Task task) {
    tasks_.push_back(std::move(task));
}

size_t Slot::fire_due(Dispatcher& dispatcher) {
    std::vector<Task> due;
    due.reserve(tasks_.size());
    size_t kept = 0;

    // Single pass: due tasks move out, the rest are compacted to the front
    for (size_t i = 0; i < tasks_.size(); ++i) {
        Task& task = tasks_[i];
        if (task.remaining_rounds() == 0) {
            due.push_back(std::move(task));
            continue;
        }

        task.decrement_round();
        if (kept != i) {
            tasks_[kept] = std::move(task);
        }
        ++kept;
    }
    tasks_.erase(tasks_.begin() + static_cast<std::ptrdiff_t>(kept), tasks_.end());

    size_t fired = 0;
    try {
        for (; fired < due.size(); ++fired) {
            dispatcher.submit(std::move(due[fired]));
        }
    } catch (...) {
        // Tasks the dispatcher refused stay resident and due
        for (size_t i = fired; i < due.size(); ++i) {
            tasks_.push_back(std::move(due[i]));
        }
        throw;
    }
    return fired;
}

std::vector<Task> Slot::drain_all() {
    std::vector<Task> drained;
    drained.swap(tasks_);
    return drained;
}

}  // namespace tickwheel::timer
