#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pstrat::core {

// Bounded single-producer/single-consumer queue.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacityPowerOfTwo);
    ~RingBuffer() = default;

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;
    RingBuffer(RingBuffer&&) = delete;
    RingBuffer& operator=(RingBuffer&&) = delete;

    bool tryEnqueue(const T& item);
    bool tryEnqueue(T&& item);

    bool tryDequeue(T& out);

    std::size_t capacity() const noexcept { return capacity_; }
    std::size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }
    bool full() const noexcept { return size() >= capacity_; }

    static bool isPowerOfTwo(std::size_t x) noexcept { return x && ((x & (x - 1)) == 0); }

private:
    template <typename U>
    bool push(U&& item);

    std::vector<T> buffer_{};
    std::size_t capacity_{};
    std::size_t mask_{};
    alignas(64) std::atomic<std::uint64_t> head_{0};
    alignas(64) std::atomic<std::uint64_t> tail_{0};
};

// ---------------------- Template definitions ----------------------

template <typename T>
inline RingBuffer<T>::RingBuffer(std::size_t capacityPowerOfTwo)
    : capacity_(capacityPowerOfTwo), mask_(capacityPowerOfTwo ? capacityPowerOfTwo - 1 : 0) {
    if (!isPowerOfTwo(capacityPowerOfTwo)) {
        throw std::invalid_argument("ring capacity must be a power of two");
    }
    buffer_.resize(capacity_);
}

template <typename T>
template <typename U>
inline bool RingBuffer<T>::push(U&& item) {
    const std::uint64_t head = head_.load(std::memory_order_relaxed);
    const std::uint64_t tail = tail_.load(std::memory_order_acquire);
    if (head - tail >= capacity_) {
        return false;
    }
    buffer_[static_cast<std::size_t>(head & mask_)] = std::forward<U>(item);
    head_.store(head + 1, std::memory_order_release);
    return true;
}

template <typename T>
inline bool RingBuffer<T>::tryEnqueue(const T& item) { return push(item); }

template <typename T>
inline bool RingBuffer<T>::tryEnqueue(T&& item) { return push(std::move(item)); }

template <typename T>
inline bool RingBuffer<T>::tryDequeue(T& out) {
    const std::uint64_t tail = tail_.load(std::memory_order_relaxed);
    const std::uint64_t head = head_.load(std::memory_order_acquire);
    if (head == tail) {
        return false;
    }
    auto& slot = buffer_[static_cast<std::size_t>(tail & mask_)];
    out = std::move(slot);
    slot = T{}; // release resources held by the slot
    tail_.store(tail + 1, std::memory_order_release);
    return true;
}

template <typename T>
inline std::size_t RingBuffer<T>::size() const noexcept {
    const auto h = head_.load(std::memory_order_acquire);
    const auto t = tail_.load(std::memory_order_acquire);
    return static_cast<std::size_t>(h - t);
}

} // namespace pstrat::core
