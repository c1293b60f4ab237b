/**
 * @file message_queue.hpp
 * @brief Multi‑producer / multi‑consumer FIFO with a lock‑free fast path.
 */

#pragma once

#include "config.hpp"
#include "logging.hpp"

#include <boost/lockfree/queue.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>

namespace mqroute {

/**
 * @brief Queue of heap‑allocated items handed over between threads.
 *
 * A bounded lock‑free ring (Boost.Lockfree) constitutes the *fast path*.
 * If the ring is full, or overflow items are still pending, writers push
 * to a secondary std::queue protected by a mutex.  The consumer drains
 * the slow path back into the ring before popping, which keeps FIFO order
 * per producer and never drops an item during bursts.
 *
 * Consumers may block with @ref pop_for; producers wake them through a
 * condition variable.
 *
 * @tparam T          Item type; the queue owns items while they are queued.
 * @tparam FastSize   Capacity of the lock‑free ring.
 */
template <typename T, std::size_t FastSize = defaults::fast_queue_size>
class MessageQueue {
  private:
    // Slow overflow path
    std::queue<T*> m_slow_queue;
    std::mutex m_mutex;
    std::atomic<std::size_t> m_slow_size{0};

    // Fast lock‑free ring
    boost::lockfree::queue<T*, boost::lockfree::capacity<FastSize>>
        m_fast_queue;

    // Consumer wake‑up
    std::atomic<std::size_t> m_size{0};
    std::mutex m_wait_mutex;
    std::condition_variable m_not_empty;

    logging::Logger m_logger;

    void push_slow(T* item) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_slow_queue.push(item);
        m_slow_size.fetch_add(1, std::memory_order_release);
        MQROUTE_LOG_WARNING(m_logger,
                            "pushed to slow queue: slow queue size={}",
                            m_slow_size.load(std::memory_order_relaxed));
    }

    // Drain slow queue back to ring. Consumer side only.
    void drain_slow() {
        if (m_slow_size.load(std::memory_order_acquire) > 0) {
            std::lock_guard<std::mutex> lock(m_mutex);
            while (!m_slow_queue.empty()) {
                T* item = m_slow_queue.front();
                if (!m_fast_queue.push(item)) {
                    break;
                }
                m_slow_queue.pop();
            }
            m_slow_size.store(m_slow_queue.size(), std::memory_order_release);
        }
    }

  public:
    MessageQueue() : m_logger(logging::create_logger("message-queue")) {}

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    ~MessageQueue() {
        // Free everything still queued.
        T* item = nullptr;
        while (m_fast_queue.pop(item)) {
            delete item;
        }
        while (!m_slow_queue.empty()) {
            delete m_slow_queue.front();
            m_slow_queue.pop();
        }
    }

    /** @brief Non‑blocking push usable from *any* thread. */
    void push(std::unique_ptr<T> item) {
        T* raw = item.release();
        m_size.fetch_add(1, std::memory_order_release);
        if (m_slow_size.load(std::memory_order_acquire) > 0 ||
            !m_fast_queue.push(raw)) {
            push_slow(raw);
        }
        {
            std::lock_guard<std::mutex> lock(m_wait_mutex);
        }
        m_not_empty.notify_one();
    }

    /**
     * @return Next item or `nullptr` when the queue is empty.
     */
    std::unique_ptr<T> pop() {
        drain_slow(); // Give overflow items a chance first.

        T* item = nullptr;
        if (m_fast_queue.pop(item)) {
            m_size.fetch_sub(1, std::memory_order_acq_rel);
            return std::unique_ptr<T>(item);
        }
        return nullptr;
    }

    /**
     * @brief Pop, waiting up to @p timeout for an item to arrive.
     * @return Next item or `nullptr` on timeout.
     */
    std::unique_ptr<T> pop_for(std::chrono::milliseconds timeout) {
        if (auto item = pop()) {
            return item;
        }
        {
            std::unique_lock<std::mutex> lock(m_wait_mutex);
            m_not_empty.wait_for(lock, timeout, [this] {
                return m_size.load(std::memory_order_acquire) > 0;
            });
        }
        return pop();
    }

    /// Wake every waiting consumer without pushing anything.
    void notify_all() {
        {
            std::lock_guard<std::mutex> lock(m_wait_mutex);
        }
        m_not_empty.notify_all();
    }

    std::size_t size() const { return m_size.load(std::memory_order_acquire); }
    bool empty() const { return size() == 0; }
};

} // namespace mqroute
