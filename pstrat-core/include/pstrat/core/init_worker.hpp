#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>

#include "pstrat/core/ring_buffer.hpp"

namespace pstrat::core {

// Single worker thread running queued tasks one at a time, in submission
// order. submit() must be called from one producer thread.
class InitWorker {
public:
    using Task = std::function<void()>;

    explicit InitWorker(std::size_t capacity);
    ~InitWorker();

    InitWorker(const InitWorker&) = delete;
    InitWorker& operator=(const InitWorker&) = delete;

    void start();
    // Runs whatever is still queued, then joins the worker
    void stop();

    // False when the queue is full or the worker is not running
    bool submit(Task task);

    // Blocks until every accepted task has finished
    void waitIdle() const;

    bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }
    std::size_t pending() const noexcept { return pending_.load(std::memory_order_acquire); }
    std::size_t completed() const noexcept { return completed_.load(std::memory_order_relaxed); }

private:
    void runLoop();
    bool runOne();

    RingBuffer<Task> queue_;
    std::thread worker_{};
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> pending_{0};
    std::atomic<std::size_t> completed_{0};
};

} // namespace pstrat::core
