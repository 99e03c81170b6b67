#pragma once

#include "talkback/server/OutboundSink.h"
#include "talkback/server/Protocol.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace talkback::server {

/**
 * @brief 文本中继：每个增量立即作为一个包提交给 Sink
 *
 * close() 只生效一次；之后 offer 的文本被丢弃。
 */
class TextRelay {
public:
    TextRelay(OutboundSink& sink, PacketKind kind, uint64_t turnId);

    TextRelay(const TextRelay&) = delete;
    TextRelay& operator=(const TextRelay&) = delete;

    // 已关闭、文本为空或 Sink 拒收时返回 false
    bool offer(const std::string& text);
    void close();
    bool isClosed() const;
    size_t forwarded() const;

private:
    OutboundSink& m_sink;
    PacketKind m_kind;
    uint64_t m_turnId;

    mutable std::mutex m_mu;
    bool m_closed{false};
    size_t m_forwarded{0};
};

/**
 * @brief 音频中继：累积合成音频，close() 时作为单个包提交（无音频则不提交）
 */
class AudioRelay {
public:
    AudioRelay(OutboundSink& sink, uint64_t turnId);

    AudioRelay(const AudioRelay&) = delete;
    AudioRelay& operator=(const AudioRelay&) = delete;

    bool offer(const std::vector<uint8_t>& chunk);

    // 返回是否提交了音频包
    bool close();
    // 关闭并丢弃已累积的音频（Turn 被取消时）
    void discard();
    bool isClosed() const;
    size_t bufferedBytes() const;

private:
    OutboundSink& m_sink;
    uint64_t m_turnId;

    mutable std::mutex m_mu;
    bool m_closed{false};
    std::vector<uint8_t> m_buffer;
};

} // namespace talkback::server
