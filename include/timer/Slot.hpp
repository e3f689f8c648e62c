#pragma once

#include "timer/Task.hpp"
#include <cstddef>
#include <vector>

namespace tickwheel::timer {

class Dispatcher;

// One wheel bucket. Touched only by the scheduling thread.
class Slot {
public:
    void add(Task task);

    // Hands every task whose remaining rounds reached zero to the dispatcher
    // and decrements the rounds of the rest. Returns the number handed off.
    size_t fire_due(Dispatcher& dispatcher);

    // Removes and returns all resident tasks (shutdown only)
    [[nodiscard]] std::vector<Task> drain_all();

    [[nodiscard]] size_t size() const { return tasks_.size(); }
    [[nodiscard]] bool empty() const { return tasks_.empty(); }

private:
    std::vector<Task> tasks_;
};

}  // namespace tickwheel::timer
