#ifndef STEPCOACH_THREAD_SAFE_QUEUE_H
#define STEPCOACH_THREAD_SAFE_QUEUE_H

#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <functional>
#include <algorithm>

namespace stepcoach {

/**
 * @brief Multi-producer queue with blocking, timed and abortable pops
 * @tparam T Element type
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() : m_closed(false) {}

    /**
     * @brief Push an item to the queue
     * @return false if the queue is closed
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            m_queue.push_back(std::move(item));
        }
        m_condition.notify_one();
        return true;
    }

    /**
     * @brief Pop an item (blocking)
     * @return The item, or empty once the queue is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait(lock, [this] { return !m_queue.empty() || m_closed; });
        return takeFrontLocked();
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return takeFrontLocked();
    }

    /**
     * @brief Pop an item, giving up after timeoutMs
     */
    std::optional<T> popWithTimeout(int timeoutMs) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                             [this] { return !m_queue.empty() || m_closed; });
        return takeFrontLocked();
    }

    /**
     * @brief Pop an item, giving up after timeout or as soon as abortWhen() holds
     *
     * abortWhen is evaluated under the queue lock every time the queue is
     * notified; call notifyAll() after changing the state it reads.
     */
    std::optional<T> popWithTimeout(std::chrono::milliseconds timeout,
                                    const std::function<bool()>& abortWhen) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait_for(lock, timeout, [this, &abortWhen] {
            return !m_queue.empty() || m_closed || (abortWhen && abortWhen());
        });
        if (abortWhen && abortWhen()) {
            return std::nullopt;
        }
        return takeFrontLocked();
    }

    /**
     * @brief Wake every waiter so it re-evaluates its predicate
     */
    void notifyAll() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
        }
        m_condition.notify_all();
    }

    /**
     * @brief Drop every queued item matching the predicate
     * @return Number of dropped items
     */
    size_t removeIf(const std::function<bool(const T&)>& predicate) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto newEnd = std::remove_if(m_queue.begin(), m_queue.end(), predicate);
        size_t removed = static_cast<size_t>(std::distance(newEnd, m_queue.end()));
        m_queue.erase(newEnd, m_queue.end());
        return removed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    /**
     * @brief Close the queue; pending items can still be popped
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_condition.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<T> m_queue;
    bool m_closed;

    std::optional<T> takeFrontLocked() {
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_queue.front());
        m_queue.pop_front();
        return item;
    }
};

} // namespace stepcoach

#endif // STEPCOACH_THREAD_SAFE_QUEUE_H
