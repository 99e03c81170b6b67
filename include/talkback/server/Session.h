#pragma once

#include "talkback/server/ErrorHandler.h"
#include "talkback/server/OutboundSink.h"
#include "talkback/server/Protocol.h"
#include "talkback/server/Responder.h"
#include "talkback/server/SttStream.h"
#include "talkback/server/Transport.h"
#include "talkback/server/Turn.h"
#include "talkback/server/TurnController.h"
#include "talkback/server/utils/Channel.h"

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace talkback::server {

/**
 * @brief 会话事件：会话线程唯一的输入来源
 */
struct SessionEvent {
    enum class Kind {
        Frame,         // 读线程收到的一帧
        TurnClosed,    // Turn 已进入 Closed，中继均已关闭
        TurnFailed,    // Turn 以致命错误结束（回复重试耗尽）
        SinkFailed,    // 出站写失败
        Disconnected   // 客户端连接结束
    };

    Kind kind{Kind::Frame};
    talkback::server::Frame frame;
    uint64_t turnId{0};
    std::optional<ErrorInfo> error;
};

/**
 * @brief 单个客户端连接的会话
 *
 * 持有 OutboundSink、TurnController 与会话事件通道；run() 在调用线程上运行会话循环，
 * 直到连接断开或发生致命错误，返回前完成全部拆除（取消 Turn、关闭 Sink 与连接、join 读线程）。
 */
class Session {
public:
    Session(std::string sessionId,
            Transport& transport,
            SttProvider& stt,
            Responder& responder,
            SpeechSynthesizer* synthesizer,
            const ErrorHandler& errorHandler,
            TurnSettings settings);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief 运行会话循环
     * @return 正常断开返回 nullopt；致命错误返回其 ErrorInfo
     */
    std::optional<ErrorInfo> run();

    const std::string& id() const { return m_sessionId; }

    // 等待中的输入帧数（Turn 忙碌时缓存）
    size_t pendingFrames() const { return m_pending.size(); }

    OutboundSink::Stats sinkStats() const { return m_sink.stats(); }

private:
    std::string tag() const;

    void readerLoop();
    // 返回 false 表示会话应结束
    bool dispatch(SessionEvent& ev);
    void enqueuePending(Frame frame);
    void drainPending();
    void handleFrame(const Frame& frame);
    void handleTextFrame(const std::string& text);
    void reject(const ErrorInfo& info);
    void teardown();

    std::string m_sessionId;
    Transport& m_transport;
    SttProvider& m_stt;
    Responder& m_responder;
    SpeechSynthesizer* m_synthesizer;
    const ErrorHandler& m_errorHandler;
    TurnSettings m_settings;

    utils::Channel<SessionEvent> m_events;
    OutboundSink m_sink;
    std::unique_ptr<TurnController> m_controller;
    std::deque<Frame> m_pending;
    std::thread m_reader;
    bool m_tornDown{false};
};

} // namespace talkback::server
