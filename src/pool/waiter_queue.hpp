//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// pool/waiter_queue.hpp
//
// Intrusive FIFO of pending acquire requests. Nodes carry their own links so
// a timed-out or cancelled waiter is unlinked in O(1) from anywhere in the
// queue.
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>

namespace pgmux {

// T must expose: T* queue_prev; T* queue_next; bool queued;
template <typename T>
class WaiterQueue {
public:
    WaiterQueue() = default;

    // Non-copyable, the queue does not own its nodes
    WaiterQueue(const WaiterQueue&) = delete;
    WaiterQueue& operator=(const WaiterQueue&) = delete;

    void PushBack(T* node) {
        node->queue_prev = tail_;
        node->queue_next = nullptr;
        if (tail_) {
            tail_->queue_next = node;
        } else {
            head_ = node;
        }
        tail_ = node;
        node->queued = true;
        size_++;
    }

    T* Front() const { return head_; }

    T* PopFront() {
        T* node = head_;
        if (node) {
            Unlink(node);
        }
        return node;
    }

    // False when the node is not in a queue
    bool Unlink(T* node) {
        if (!node->queued) {
            return false;
        }
        if (node->queue_prev) {
            node->queue_prev->queue_next = node->queue_next;
        } else {
            head_ = node->queue_next;
        }
        if (node->queue_next) {
            node->queue_next->queue_prev = node->queue_prev;
        } else {
            tail_ = node->queue_prev;
        }
        node->queue_prev = nullptr;
        node->queue_next = nullptr;
        node->queued = false;
        size_--;
        return true;
    }

    bool Empty() const { return head_ == nullptr; }
    size_t Size() const { return size_; }

private:
    T* head_ = nullptr;
    T* tail_ = nullptr;
    size_t size_ = 0;
};

} // namespace pgmux
