/**
 * @file BoundedQueue.hpp
 * @brief Fixed-capacity FIFO channel between a producer thread and the session loop
 */

#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace OptionsScalper {

/**
 * @class BoundedQueue
 * @brief Thread-safe FIFO with a capacity limit and non-blocking operations
 *
 * Producers (the websocket I/O thread) call tryPush(); the single consumer
 * drains with tryPop(). A full queue rejects new items instead of blocking
 * the network thread.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : m_capacity(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Append an item
     * @param value Item to append
     * @return false if the queue is at capacity
     */
    bool tryPush(T value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.size() >= m_capacity) {
            return false;
        }
        m_queue.push_back(std::move(value));
        return true;
    }

    /**
     * @brief Remove the front item if there is one
     */
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(m_queue.front());
        m_queue.pop_front();
        return value;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    std::size_t capacity() const { return m_capacity; }

private:
    const std::size_t m_capacity;  ///< Maximum number of queued items
    mutable std::mutex m_mutex;    ///< Guards m_queue
    std::deque<T> m_queue;         ///< FIFO storage
};

}  // namespace OptionsScalper
