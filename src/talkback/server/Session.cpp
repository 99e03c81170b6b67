#include "talkback/server/Session.h"

#include <utility>

namespace talkback::server {

using LogLevel = ErrorHandler::LogLevel;

Session::Session(std::string sessionId,
                 Transport& transport,
                 SttProvider& stt,
                 Responder& responder,
                 SpeechSynthesizer* synthesizer,
                 const ErrorHandler& errorHandler,
                 TurnSettings settings)
    : m_sessionId(std::move(sessionId))
    , m_transport(transport)
    , m_stt(stt)
    , m_responder(responder)
    , m_synthesizer(synthesizer)
    , m_errorHandler(errorHandler)
    , m_settings(settings)
    , m_sink(transport, errorHandler, [this](const ErrorInfo& info) {
        SessionEvent ev;
        ev.kind = SessionEvent::Kind::SinkFailed;
        ev.error = info;
        m_events.push(std::move(ev));
    })
{}

Session::~Session() {
    teardown();
}

std::string Session::tag() const {
    std::string t = "[session=" + m_sessionId;
    if (m_controller) t += " turn=" + std::to_string(m_controller->currentTurnId());
    return t + "] ";
}

std::optional<ErrorInfo> Session::run() {
    TurnContext ctx{m_sink, m_stt, m_responder, m_synthesizer, m_errorHandler, m_settings, m_sessionId};
    m_controller = std::make_unique<TurnController>(ctx,
        [this](uint64_t turnId, const std::optional<ErrorInfo>& failure) {
            SessionEvent ev;
            ev.kind = failure.has_value() ? SessionEvent::Kind::TurnFailed : SessionEvent::Kind::TurnClosed;
            ev.turnId = turnId;
            ev.error = failure;
            // 会话拆除后通道已关闭，事件直接丢弃
            m_events.push(std::move(ev));
        });

    m_errorHandler.log(LogLevel::Info, tag() + "session started");
    m_reader = std::thread([this]() { readerLoop(); });

    std::optional<ErrorInfo> fatal;
    try {
        SessionEvent ev;
        while (m_events.pop(ev)) {
            if (!dispatch(ev)) break;
        }
    } catch (const SessionError& e) {
        fatal = e.errorInfo();
        fatal->addContext("session_id", m_sessionId);
        m_errorHandler.log(LogLevel::Error, tag() + "fatal session error, tearing down", fatal);
    } catch (const std::exception& e) {
        fatal = ErrorInfo::make(ErrorType::UnknownError, e.what());
        fatal->addContext("session_id", m_sessionId);
        m_errorHandler.log(LogLevel::Error, tag() + "unexpected session error, tearing down", fatal);
    }

    teardown();
    return fatal;
}

void Session::readerLoop() {
    for (;;) {
        SessionEvent ev;
        ErrorInfo err;
        if (!m_transport.readFrame(ev.frame, &err)) {
            SessionEvent done;
            done.kind = SessionEvent::Kind::Disconnected;
            if (!err.message.empty()) done.error = err;
            m_events.push(std::move(done));
            return;
        }
        ev.kind = SessionEvent::Kind::Frame;
        if (!m_events.push(std::move(ev))) return;
    }
}

bool Session::dispatch(SessionEvent& ev) {
    switch (ev.kind) {
        case SessionEvent::Kind::Frame:
            if (m_controller->isBusy() || !m_pending.empty()) {
                enqueuePending(std::move(ev.frame));
            } else {
                handleFrame(ev.frame);
            }
            return true;

        case SessionEvent::Kind::TurnClosed:
            if (m_controller->onTurnClosed(ev.turnId)) {
                drainPending();
            }
            return true;

        case SessionEvent::Kind::TurnFailed:
        case SessionEvent::Kind::SinkFailed:
            throw SessionError(ev.error.value_or(ErrorInfo::make(ErrorType::UnknownError, "session failure")));

        case SessionEvent::Kind::Disconnected:
            if (ev.error.has_value()) {
                m_errorHandler.log(LogLevel::Info, tag() + "client connection ended", ev.error);
            } else {
                m_errorHandler.log(LogLevel::Info, tag() + "client disconnected");
            }
            return false;
    }
    return true;
}

void Session::enqueuePending(Frame frame) {
    if (m_pending.size() >= m_settings.pendingFrameLimit) {
        auto info = ErrorInfo::make(ErrorType::ProtocolError,
            "input buffer full (" + std::to_string(m_settings.pendingFrameLimit) + " frames), frame dropped");
        reject(info);
        return;
    }
    m_pending.push_back(std::move(frame));
}

void Session::drainPending() {
    if (!m_pending.empty()) {
        m_errorHandler.log(LogLevel::Debug, tag() + "replaying " + std::to_string(m_pending.size()) + " buffered frame(s)");
    }
    while (!m_pending.empty() && !m_controller->isBusy()) {
        Frame frame = std::move(m_pending.front());
        m_pending.pop_front();
        handleFrame(frame);
    }
}

void Session::handleFrame(const Frame& frame) {
    if (frame.binary) {
        m_controller->onAudio(frame.payload);
        return;
    }
    handleTextFrame(frame.payload);
}

void Session::handleTextFrame(const std::string& text) {
    ErrorInfo err;
    auto msg = parseInboundMessage(text, &err);
    if (!msg.has_value()) {
        reject(err);
        return;
    }
    if (msg->conversationId.empty()) {
        reject(ErrorInfo::make(ErrorType::ProtocolError, "message rejected: missing conversationId"));
        return;
    }

    if (msg->isAudioEnd()) {
        const auto result = m_controller->endOfInput(msg->conversationId);
        m_errorHandler.log(LogLevel::Info,
            tag() + (result.complete ? "utterance: \"" : "partial utterance: \"") + result.text + "\"");
        return;
    }
    if (msg->text.empty()) {
        reject(ErrorInfo::make(ErrorType::ProtocolError, "message rejected: empty text for type \"" + msg->type + "\""));
        return;
    }
    m_errorHandler.log(LogLevel::Info, tag() + "text input: \"" + msg->text + "\"");
    m_controller->submitText(msg->text, msg->conversationId);
}

void Session::reject(const ErrorInfo& info) {
    m_errorHandler.log(LogLevel::Warning, tag() + info.message, info);
    // turnId 0：会话级通知，不属于任何 Turn
    if (!m_sink.submit(OutboundPacket::makeText(PacketKind::Error, 0, info.message))) {
        m_errorHandler.log(LogLevel::Debug, tag() + "sink closed, rejection not delivered");
    }
}

void Session::teardown() {
    if (m_tornDown) return;
    m_tornDown = true;

    if (m_controller) m_controller->shutdown();
    m_sink.close();
    m_transport.close();
    m_events.close();
    if (m_reader.joinable()) m_reader.join();

    if (!m_pending.empty()) {
        m_errorHandler.log(LogLevel::Warning,
            tag() + "session ended with " + std::to_string(m_pending.size()) + " unprocessed frame(s)");
        m_pending.clear();
    }
    const auto stats = m_sink.stats();
    m_errorHandler.log(LogLevel::Info, tag() + "session closed", std::nullopt);
    m_errorHandler.log(LogLevel::Debug,
        tag() + "sink stats: packets=" + std::to_string(stats.packetsWritten) +
        " bytes=" + std::to_string(stats.bytesWritten) +
        " rejected=" + std::to_string(stats.packetsRejected));
}

} // namespace talkback::server
