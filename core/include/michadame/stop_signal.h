#pragma once

/**
 * @file stop_signal.h
 * @brief Shared cancellation flag for worker threads
 */

#include <atomic>

namespace michadame {

/**
 * @brief One-way stop flag observed by worker loops
 *
 * requestStop() is idempotent and there is no reset. A signal constructed
 * with a parent reports stopped when either itself or the parent is set,
 * which lets an owner stop its own helper threads without touching the
 * caller's signal.
 */
class StopSignal {
public:
    StopSignal() = default;
    explicit StopSignal(const StopSignal* parent) : m_parent(parent) {}

    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void requestStop() { m_stopped.store(true, std::memory_order_release); }

    bool stopRequested() const {
        if (m_stopped.load(std::memory_order_acquire)) return true;
        return m_parent && m_parent->stopRequested();
    }

private:
    std::atomic<bool> m_stopped{false};
    const StopSignal* m_parent = nullptr;
};

} // namespace michadame
