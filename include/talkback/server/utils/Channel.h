#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace talkback::server::utils {

/**
 * @brief 多生产者/多消费者阻塞队列
 *
 * close() 之后 push 失败；已入队的元素仍可被取出，取空后 pop 返回 false。
 * 可选容量上限（0 表示无界）：满时 tryPush 失败，不阻塞生产者。
 */
template <typename T>
class Channel {
public:
    enum class PopStatus {
        Ok,
        Timeout,
        Closed
    };

    explicit Channel(std::size_t capacity = 0)
        : m_capacity(capacity)
    {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief 入队；通道已关闭或已满时返回 false
     */
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (m_closed) return false;
            if (m_capacity != 0 && m_queue.size() >= m_capacity) return false;
            m_queue.push_back(std::move(value));
        }
        m_cv.notify_one();
        return true;
    }

    /**
     * @brief 阻塞直到取到元素；通道关闭且为空时返回 false
     */
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(m_mutex);
        m_cv.wait(lk, [&] { return m_closed || !m_queue.empty(); });
        if (m_queue.empty()) return false;
        out = std::move(m_queue.front());
        m_queue.pop_front();
        return true;
    }

    template <typename Rep, typename Period>
    PopStatus popFor(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(m_mutex);
        if (!m_cv.wait_for(lk, timeout, [&] { return m_closed || !m_queue.empty(); })) {
            return PopStatus::Timeout;
        }
        if (m_queue.empty()) return PopStatus::Closed;
        out = std::move(m_queue.front());
        m_queue.pop_front();
        return PopStatus::Ok;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_closed;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_queue.size();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<T> m_queue;
    std::size_t m_capacity{0};
    bool m_closed{false};
};

} // namespace talkback::server::utils
