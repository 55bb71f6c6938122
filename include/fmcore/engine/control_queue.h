#pragma once

#include <array>
#include <atomic>
#include <cstddef>

namespace fmcore {

/**
 * Lock-free single-producer/single-consumer ring buffer.
 *
 * One control thread pushes, the audio thread pops. Neither side blocks or
 * allocates; push() fails when the ring is full and the caller decides what
 * to do with the item.
 */
template <typename T, size_t Capacity>
class SpscQueue {
public:
    SpscQueue() : head_(0), tail_(0) {}

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    // Producer side
    bool push(const T& item) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t nextTail = (tail + 1) % kSlots;
        if (nextTail == head_.load(std::memory_order_acquire)) {
            return false;
        }
        slots_[tail] = item;
        tail_.store(nextTail, std::memory_order_release);
        return true;
    }

    // Consumer side
    bool pop(T& item) {
        const size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        item = slots_[head];
        head_.store((head + 1) % kSlots, std::memory_order_release);
        return true;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    // Approximate when called while the other side is active
    size_t size() const {
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t tail = tail_.load(std::memory_order_acquire);
        return (tail + kSlots - head) % kSlots;
    }

    static constexpr size_t capacity() { return Capacity; }

private:
    static constexpr size_t kSlots = Capacity + 1;   // One slot always stays empty

    std::array<T, kSlots> slots_;
    std::atomic<size_t> head_;
    std::atomic<size_t> tail_;
};

} // namespace fmcore
