#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace talkback::server {

/**
 * @brief 单个 Turn 的转写聚合
 *
 * 片段按到达顺序直接拼接（片段间的空白由 STT 适配层负责）。
 * finalize() 是同步屏障：在 STT 确认 flush（或流关闭）之前阻塞，
 * 保证确认之前产出的所有片段都已并入话语。
 *
 * 屏障按流代号生效：重连后 rearm() 切换到新代号，旧流迟到的 Flushed/Closed 不再解除屏障。
 */
class TranscriptAggregator {
public:
    struct Result {
        std::string text;
        // false 表示屏障超时，text 为截至当时的部分话语
        bool complete{true};
    };

    TranscriptAggregator() = default;

    TranscriptAggregator(const TranscriptAggregator&) = delete;
    TranscriptAggregator& operator=(const TranscriptAggregator&) = delete;

    // finalize 之后到达的片段被丢弃，返回 false
    bool onFragment(const std::string& text);

    // 切换到新一代 STT 流，屏障重新上锁
    void rearm(uint32_t generation);

    // STT 已确认 flush；带代号的重载只接受当前代
    void onFlushed();
    void onFlushed(uint32_t generation);

    // STT 流已结束，不会再有片段
    void onStreamClosed();
    void onStreamClosed(uint32_t generation);

    /**
     * @brief 等待屏障并取出话语（清空缓冲）
     * @throws std::logic_error 同一个聚合器上第二次调用
     */
    Result finalize(std::chrono::milliseconds timeout);

    bool isFinalized() const;
    size_t fragmentCount() const;

private:
    mutable std::mutex m_mu;
    std::condition_variable m_cv;
    std::string m_buffer;
    size_t m_fragments{0};
    uint32_t m_generation{0};
    bool m_barrierResolved{false};
    bool m_finalized{false};
};

} // namespace talkback::server
