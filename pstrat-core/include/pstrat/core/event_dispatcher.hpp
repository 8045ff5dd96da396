#pragma once

#include <atomic>
#include <cstddef>
#include <thread>

#include "pstrat/core/events.hpp"
#include "pstrat/core/ring_buffer.hpp"

namespace pstrat::core {

class StrategyEngine; // fwd

// Ordered external event queue drained by the engine's control thread.
// post() must be called from a single producer thread. Lifecycle calls on
// the engine must not overlap with a running dispatcher.
class EventDispatcher {
public:
    EventDispatcher(StrategyEngine& engine, std::size_t capacity);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void start();
    // Delivers whatever is still queued, then joins the control thread
    void stop();

    // False when the queue is full; the event is counted as dropped
    bool post(EngineEvent ev);

    // Blocks until the queue is empty and the last event has been handled
    void waitIdle() const;

    bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }
    std::size_t posted() const noexcept { return posted_.load(std::memory_order_relaxed); }
    std::size_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    std::size_t processed() const noexcept { return processed_.load(std::memory_order_acquire); }

private:
    void runLoop();
    bool dispatchOne();

    StrategyEngine& engine_;
    RingBuffer<EngineEvent> queue_;
    std::thread worker_{};
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> posted_{0};
    std::atomic<std::size_t> dropped_{0};
    std::atomic<std::size_t> processed_{0};
};

} // namespace pstrat::core
