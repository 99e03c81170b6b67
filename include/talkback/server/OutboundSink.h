#pragma once

#include "talkback/server/ErrorHandler.h"
#include "talkback/server/Protocol.h"
#include "talkback/server/Transport.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace talkback::server {

/**
 * @brief 会话唯一的出站写者
 *
 * 所有生产者通过 submit() 入队（无界，不阻塞）；单个写线程按入队顺序编码并写入 Transport，
 * 因此写操作从不交错。写失败后 Sink 自行关闭，之后的 submit 返回 false，
 * 并通过 onFailure 回调通知会话。
 */
class OutboundSink {
public:
    struct Stats {
        uint64_t packetsWritten{0};
        uint64_t bytesWritten{0};
        uint64_t packetsRejected{0};
    };

    using FailureCallback = std::function<void(const ErrorInfo&)>;

    OutboundSink(Transport& transport, const ErrorHandler& errorHandler, FailureCallback onFailure = nullptr);
    ~OutboundSink();

    OutboundSink(const OutboundSink&) = delete;
    OutboundSink& operator=(const OutboundSink&) = delete;

    // 入队；Sink 已关闭时返回 false
    bool submit(OutboundPacket packet);

    // 等待队列清空且无在途写操作；超时或 Sink 已失败返回 false
    bool waitIdle(std::chrono::milliseconds timeout);

    // 停止接收新包，写完已入队的包后退出写线程；可重复调用
    void close();

    bool isClosed() const;
    bool hasFailed() const;
    Stats stats() const;

private:
    void writerLoop();

    Transport& m_transport;
    const ErrorHandler& m_errorHandler;
    FailureCallback m_onFailure;

    mutable std::mutex m_mu;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::deque<OutboundPacket> m_queue;
    bool m_closed{false};
    bool m_failed{false};
    bool m_writing{false};
    Stats m_stats;

    std::thread m_writer;
};

} // namespace talkback::server
