#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace talkback::server::utils {

/**
 * @brief 可共享的取消信号
 *
 * 拷贝共享同一状态。cancel() 只生效一次，并依次执行已注册的回调
 * （用于关闭通道、中止 HTTP 流等）；取消之后注册的回调立即执行。
 */
class CancelToken {
public:
    CancelToken()
        : m_state(std::make_shared<State>())
    {}

    void cancel() const {
        std::vector<std::function<void()>> callbacks;
        {
            std::lock_guard<std::mutex> lk(m_state->mutex);
            if (m_state->cancelled) return;
            m_state->cancelled = true;
            callbacks.swap(m_state->callbacks);
        }
        for (auto& cb : callbacks) {
            if (cb) cb();
        }
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lk(m_state->mutex);
        return m_state->cancelled;
    }

    void onCancel(std::function<void()> cb) const {
        {
            std::lock_guard<std::mutex> lk(m_state->mutex);
            if (!m_state->cancelled) {
                m_state->callbacks.push_back(std::move(cb));
                return;
            }
        }
        if (cb) cb();
    }

private:
    struct State {
        std::mutex mutex;
        bool cancelled{false};
        std::vector<std::function<void()>> callbacks;
    };
    std::shared_ptr<State> m_state;
};

} // namespace talkback::server::utils
