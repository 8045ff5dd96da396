#include "pstrat/core/event_dispatcher.hpp"
#include "pstrat/core/strategy_engine.hpp"

#include <chrono>
#include <utility>

namespace pstrat::core {

EventDispatcher::EventDispatcher(StrategyEngine& engine, std::size_t capacity)
    : engine_(engine), queue_(capacity) {}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    worker_ = std::thread([this] { runLoop(); });
}

void EventDispatcher::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool EventDispatcher::post(EngineEvent ev) {
    if (!queue_.tryEnqueue(std::move(ev))) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    posted_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool EventDispatcher::dispatchOne() {
    EngineEvent ev{};
    if (!queue_.tryDequeue(ev)) return false;
    engine_.processEvent(ev);
    processed_.fetch_add(1, std::memory_order_release);
    return true;
}

void EventDispatcher::runLoop() {
    while (running_.load(std::memory_order_acquire)) {
        if (!dispatchOne()) {
            std::this_thread::yield();
        }
    }
    while (dispatchOne()) {}
}

void EventDispatcher::waitIdle() const {
    while (processed_.load(std::memory_order_acquire) < posted_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
    }
}

} // namespace pstrat::core
