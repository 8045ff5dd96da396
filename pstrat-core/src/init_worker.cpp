#include "pstrat/core/init_worker.hpp"

#include <chrono>
#include <utility>

namespace pstrat::core {

InitWorker::InitWorker(std::size_t capacity) : queue_(capacity) {}

InitWorker::~InitWorker() {
    stop();
}

void InitWorker::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    worker_ = std::thread([this] { runLoop(); });
}

void InitWorker::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool InitWorker::submit(Task task) {
    if (!task || !isRunning()) return false;
    // count first so waitIdle() never observes a queued task as done
    pending_.fetch_add(1, std::memory_order_acq_rel);
    if (!queue_.tryEnqueue(std::move(task))) {
        pending_.fetch_sub(1, std::memory_order_acq_rel);
        return false;
    }
    return true;
}

bool InitWorker::runOne() {
    Task task;
    if (!queue_.tryDequeue(task)) return false;
    // Settles the task even if it unwinds, so waitIdle() cannot wedge
    struct Settle {
        InitWorker& w;
        ~Settle() {
            w.completed_.fetch_add(1, std::memory_order_relaxed);
            w.pending_.fetch_sub(1, std::memory_order_acq_rel);
        }
    } settle{*this};
    // Tasks own their error handling; the engine wraps strategy hooks.
    task();
    return true;
}

void InitWorker::runLoop() {
    while (running_.load(std::memory_order_acquire)) {
        if (!runOne()) {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    }
    while (runOne()) {}
}

void InitWorker::waitIdle() const {
    while (pending_.load(std::memory_order_acquire) != 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
    }
}

} // namespace pstrat::core
