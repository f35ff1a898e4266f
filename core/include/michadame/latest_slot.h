#pragma once

/**
 * @file latest_slot.h
 * @brief Single-slot handoff between a producer and a consumer thread
 *
 * Holds at most one value. Neither side ever blocks waiting for the other:
 * the producer either replaces the held value (publish) or gives up
 * (tryPublish), and the consumer takes whatever is there (tryTake).
 */

#include <mutex>
#include <optional>
#include <utility>

namespace michadame {

template <typename T>
class LatestSlot {
public:
    LatestSlot() = default;
    LatestSlot(const LatestSlot&) = delete;
    LatestSlot& operator=(const LatestSlot&) = delete;

    /**
     * @brief Store a value, replacing any unconsumed one
     * @return true if an older value was discarded
     */
    bool publish(T value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        bool replaced = m_value.has_value();
        m_value = std::move(value);
        return replaced;
    }

    /**
     * @brief Store a value only if the slot is empty
     * @return false if the slot was occupied (value is dropped)
     */
    bool tryPublish(T value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_value.has_value()) return false;
        m_value = std::move(value);
        return true;
    }

    /// Take the held value, leaving the slot empty
    std::optional<T> tryTake() {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::optional<T> out;
        out.swap(m_value);
        return out;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return !m_value.has_value();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_value.reset();
    }

private:
    mutable std::mutex m_mutex;
    std::optional<T> m_value;
};

} // namespace michadame
