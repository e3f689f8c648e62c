#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

namespace tickwheel::util {

// Unbounded multi-producer / single-consumer queue.
//
// Producers link a new node with one atomic exchange on head_, so push never
// blocks or retries. The consumer owns tail_ (a stub node whose successor is
// the next element) and is the only thread allowed to call try_pop/empty.
// A push that has exchanged head_ but not yet linked next may be invisible
// to the consumer for a moment; it shows up on a later try_pop.
template <class T>
class MpscQueue {
public:
    MpscQueue() : head_(std::make_unique<Node>().release()), tail_(head_.load(std::memory_order_relaxed)) {}

    ~MpscQueue() {
        Node* node = tail_;
        while (node) {
            std::unique_ptr<Node> owned(node);
            node = owned->next.load(std::memory_order_relaxed);
        }
    }

    MpscQueue(const MpscQueue&) = delete;
    MpscQueue& operator=(const MpscQueue&) = delete;

    void push(T value) {
        // Owned until published; a throwing move leaves the queue untouched
        auto owned = std::make_unique<Node>();
        owned->value.emplace(std::move(value));
        Node* node = owned.release();
        Node* prev = head_.exchange(node, std::memory_order_acq_rel);
        prev->next.store(node, std::memory_order_release);
    }

    // Consumer only
    [[nodiscard]] std::optional<T> try_pop() {
        Node* tail = tail_;
        Node* next = tail->next.load(std::memory_order_acquire);
        if (!next) return std::nullopt;

        std::optional<T> out(std::move(next->value));
        next->value.reset();
        tail_ = next;
        std::unique_ptr<Node> old_stub(tail);
        return out;
    }

    // Consumer only
    [[nodiscard]] bool empty() const {
        return tail_->next.load(std::memory_order_acquire) == nullptr;
    }

private:
    struct Node {
        std::atomic<Node*> next{nullptr};
        std::optional<T> value;
    };

    static constexpr size_t cacheLineSize = 64;

    alignas(cacheLineSize) std::atomic<Node*> head_;
    alignas(cacheLineSize) Node* tail_;
};

}  // namespace tickwheel::util
