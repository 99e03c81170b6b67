#include "talkback/server/Turn.h"

#include "talkback/server/SentenceBuffer.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace talkback::server {

using LogLevel = ErrorHandler::LogLevel;

const char* turnStateToString(TurnState s) {
    switch (s) {
        case TurnState::Listening: return "Listening";
        case TurnState::Finalizing: return "Finalizing";
        case TurnState::Responding: return "Responding";
        default: return "Closed";
    }
}

TurnSettings TurnSettings::fromConfig(const ConfigManager& cfg) {
    TurnSettings s;
    s.finalizeTimeout = std::chrono::milliseconds(
        std::max<long long>(1, cfg.getInt("turn.finalize_timeout_ms", s.finalizeTimeout.count())));
    s.pendingFrameLimit = static_cast<size_t>(
        std::max<long long>(1, cfg.getInt("turn.pending_frame_limit", static_cast<long long>(s.pendingFrameLimit))));
    s.sttOpenRetries = static_cast<uint32_t>(
        std::max<long long>(0, cfg.getInt("turn.stt_open_retries", s.sttOpenRetries)));
    s.sttRetryInitialDelayMs = static_cast<uint32_t>(
        std::max<long long>(0, cfg.getInt("turn.stt_retry_initial_delay_ms", s.sttRetryInitialDelayMs)));
    s.responderRetries = static_cast<uint32_t>(
        std::max<long long>(0, cfg.getInt("llm.max_retries", s.responderRetries)));
    return s;
}

static ErrorHandler makeRetryHandler(const ErrorHandler& base, uint32_t maxRetries, uint32_t initialDelayMs) {
    auto policy = ErrorHandler::RetryPolicy::makeDefault();
    policy.maxRetries = maxRetries;
    policy.initialDelayMs = initialDelayMs;
    policy.maxDelayMs = std::max<uint32_t>(initialDelayMs, 5000);
    ErrorHandler h(policy);
    h.setLoggerConfig(base.getLoggerConfig());
    return h;
}

// 分片睡眠，取消后尽快返回
static void sleepUnlessCancelled(const utils::CancelToken& cancel, uint32_t delayMs) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delayMs);
    while (!cancel.isCancelled()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::milliseconds(20)));
    }
}

Turn::Turn(uint64_t id, const TurnContext& ctx, DoneCallback onDone)
    : m_id(id)
    , m_ctx(ctx)
    , m_onDone(std::move(onDone))
    , m_sttRetry(makeRetryHandler(ctx.errorHandler, ctx.settings.sttOpenRetries, ctx.settings.sttRetryInitialDelayMs))
    , m_responderRetry(makeRetryHandler(ctx.errorHandler, ctx.settings.responderRetries, 500))
    , m_sttEvents(std::make_shared<utils::Channel<SttEvent>>())
    , m_heardSpeech(std::make_shared<std::atomic<bool>>(false))
    , m_sentences(std::make_shared<utils::Channel<std::string>>())
    , m_transcriptRelay(ctx.sink, PacketKind::Transcript, id)
    , m_textRelay(ctx.sink, PacketKind::BotText, id)
    , m_audioRelay(ctx.sink, id)
{
    // 取消时关闭本 Turn 所有可能阻塞的通道
    m_cancel.onCancel([events = m_sttEvents, sentences = m_sentences]() {
        events->close();
        sentences->close();
    });
}

Turn::~Turn() {
    cancel();
    join();
}

std::string Turn::tag() const {
    return "[session=" + m_ctx.sessionId + " turn=" + std::to_string(m_id) + "] ";
}

void Turn::sendAudio(const std::string& audio) {
    if (m_state.load() != TurnState::Listening) {
        throw std::logic_error("Turn::sendAudio outside Listening");
    }
    if (!m_stt) {
        openStt();
    }

    ErrorInfo err;
    if (m_stt->send(audio, &err)) return;

    m_ctx.errorHandler.log(LogLevel::Warning, tag() + "STT write failed, reconnecting once", err);

    // 先切换代号：旧流此前或随后产生的 Flushed/Closed 都不再解除屏障
    const uint32_t gen = m_sttGeneration + 1;
    m_aggregator.rearm(gen);
    m_stt->close();
    m_stt.reset();

    ErrorInfo reopenErr;
    auto fresh = openStream(gen, &reopenErr);
    if (!fresh) {
        reopenErr.message = "STT reconnect failed: " + reopenErr.message;
        reopenErr.addContext("session_id", m_ctx.sessionId);
        reopenErr.addContext("turn_id", std::to_string(m_id));
        throw SessionError(reopenErr);
    }
    m_sttGeneration = gen;

    ErrorInfo resendErr;
    if (!fresh->send(audio, &resendErr)) {
        fresh->close();
        resendErr.message = "STT write failed after reconnect: " + resendErr.message;
        resendErr.addContext("session_id", m_ctx.sessionId);
        resendErr.addContext("turn_id", std::to_string(m_id));
        throw SessionError(resendErr);
    }
    m_stt = std::move(fresh);
    m_ctx.errorHandler.log(LogLevel::Info, tag() + "audio chunk delivered after STT reconnect");
}

TranscriptAggregator::Result Turn::finalize() {
    TurnState expected = TurnState::Listening;
    if (!m_state.compare_exchange_strong(expected, TurnState::Finalizing)) {
        throw std::logic_error(std::string("Turn::finalize from state ") + turnStateToString(expected));
    }

    if (!m_stt) {
        // 本 Turn 没有收到任何音频
        m_aggregator.onStreamClosed();
    } else {
        ErrorInfo err;
        if (!m_stt->flush(&err)) {
            m_ctx.errorHandler.log(LogLevel::Warning, tag() + "STT flush failed, closing stream to settle transcript", err);
            closeStt();
        }
    }

    auto result = m_aggregator.finalize(m_ctx.settings.finalizeTimeout);
    if (!result.complete) {
        m_ctx.errorHandler.log(LogLevel::Warning,
            tag() + "transcript barrier timed out after " + std::to_string(m_ctx.settings.finalizeTimeout.count()) +
            "ms, using partial utterance");
    }
    closeStt();
    return result;
}

void Turn::beginDirectText() {
    TurnState expected = TurnState::Listening;
    if (!m_state.compare_exchange_strong(expected, TurnState::Finalizing)) {
        throw std::logic_error(std::string("Turn::beginDirectText from state ") + turnStateToString(expected));
    }
    if (m_stt) {
        m_ctx.errorHandler.log(LogLevel::Warning,
            tag() + "text input while listening, discarding " + std::to_string(m_aggregator.fragmentCount()) +
            " transcript fragment(s)");
    }
    closeStt();
}

void Turn::respond(std::string utterance, std::string conversationId) {
    TurnState expected = TurnState::Finalizing;
    if (!m_state.compare_exchange_strong(expected, TurnState::Responding)) {
        throw std::logic_error(std::string("Turn::respond from state ") + turnStateToString(expected));
    }
    if (m_ctx.synthesizer) {
        m_synthesizer = std::thread([this]() { synthesisLoop(); });
    }
    m_responder = std::thread([this, u = std::move(utterance), c = std::move(conversationId)]() mutable {
        responderLoop(std::move(u), std::move(c));
    });
}

void Turn::closeEmpty() {
    if (m_state.load() != TurnState::Finalizing) {
        throw std::logic_error(std::string("Turn::closeEmpty from state ") + turnStateToString(m_state.load()));
    }
    m_ctx.errorHandler.log(LogLevel::Info, tag() + "empty utterance, no reply");
    complete(std::nullopt);
}

void Turn::cancel() {
    m_cancel.cancel();
}

void Turn::join() {
    closeStt();
    if (m_responder.joinable()) m_responder.join();
    if (m_synthesizer.joinable()) m_synthesizer.join();
}

void Turn::openStt() {
    const uint32_t gen = m_sttGeneration + 1;
    m_aggregator.rearm(gen);

    for (uint32_t attempt = 0;; ++attempt) {
        ErrorInfo err;
        auto stream = openStream(gen, &err);
        if (stream) {
            m_stt = std::move(stream);
            m_sttGeneration = gen;
            break;
        }
        err.addContext("session_id", m_ctx.sessionId);
        err.addContext("turn_id", std::to_string(m_id));
        err.addContext("attempt", std::to_string(attempt + 1));
        if (!m_sttRetry.shouldRetry(err, attempt)) {
            err.message = "STT open failed: " + err.message;
            throw SessionError(err);
        }
        const auto delay = m_sttRetry.getRetryDelayMs(err, attempt);
        m_ctx.errorHandler.log(LogLevel::Warning,
            tag() + "STT open failed, retrying in " + std::to_string(delay) + "ms", err);
        sleepUnlessCancelled(m_cancel, delay);
    }

    if (!m_sttReader.joinable()) {
        m_sttReader = std::thread([this]() { sttReaderLoop(); });
    }
    m_ctx.errorHandler.log(LogLevel::Debug, tag() + "STT stream opened (generation " + std::to_string(gen) + ")");
}

std::unique_ptr<SttStream> Turn::openStream(uint32_t generation, ErrorInfo* err) {
    auto events = m_sttEvents;
    auto heard = m_heardSpeech;
    // 旧流 close() 返回时其事件已全部经过此回调，heard 即为重连时刻的准确状态
    return m_ctx.stt.open([events, heard, generation](SttEvent ev) {
        if (ev.kind == SttEvent::Kind::Fragment && !ev.text.empty()) heard->store(true);
        ev.generation = generation;
        events->push(std::move(ev));
    }, heard->load(), err);
}

void Turn::closeStt() {
    if (m_stt) {
        m_stt->close();
        m_stt.reset();
    }
    m_sttEvents->close();
    if (m_sttReader.joinable()) m_sttReader.join();
    m_transcriptRelay.close();
}

void Turn::sttReaderLoop() {
    SttEvent ev;
    while (m_sttEvents->pop(ev)) {
        if (m_cancel.isCancelled()) break;
        switch (ev.kind) {
            case SttEvent::Kind::Fragment:
                if (ev.text.empty()) break;
                if (m_aggregator.onFragment(ev.text)) {
                    m_transcriptRelay.offer(ev.text);
                } else {
                    m_ctx.errorHandler.log(LogLevel::Debug, tag() + "late transcript fragment dropped");
                }
                break;
            case SttEvent::Kind::Flushed:
                m_aggregator.onFlushed(ev.generation);
                break;
            case SttEvent::Kind::Closed:
                m_aggregator.onStreamClosed(ev.generation);
                break;
            case SttEvent::Kind::Error:
                m_ctx.errorHandler.log(LogLevel::Warning, tag() + "STT stream reported an error",
                                       ev.error.value_or(ErrorInfo::make(ErrorType::NetworkError, "unknown STT error")));
                break;
        }
    }
    // 通道关闭：不会再有片段
    m_aggregator.onStreamClosed();
}

void Turn::responderLoop(std::string utterance, std::string conversationId) {
    SentenceBuffer sentences;
    bool emitted = false;
    const bool speak = m_ctx.synthesizer != nullptr;

    TextCallback onText = [&](std::string_view delta) {
        if (delta.empty() || m_cancel.isCancelled()) return;
        emitted = true;
        m_textRelay.offer(std::string(delta));
        if (speak) {
            for (auto& s : sentences.feed(delta)) m_sentences->push(std::move(s));
        }
    };

    std::optional<ErrorInfo> failure;
    for (uint32_t attempt = 0;; ++attempt) {
        ErrorInfo err;
        if (m_ctx.responder.streamReply(utterance, conversationId, m_cancel, onText, &err)) break;
        if (m_cancel.isCancelled()) break;

        // 已输出部分回复时无法重放
        if (!emitted && m_responderRetry.shouldRetry(err, attempt)) {
            const auto delay = m_responderRetry.getRetryDelayMs(err, attempt);
            m_ctx.errorHandler.log(LogLevel::Warning, tag() + "reply failed, retrying in " + std::to_string(delay) + "ms", err);
            sleepUnlessCancelled(m_cancel, delay);
            continue;
        }
        err.addContext("session_id", m_ctx.sessionId);
        err.addContext("turn_id", std::to_string(m_id));
        err.addContext("attempts", std::to_string(attempt + 1));
        m_ctx.errorHandler.log(LogLevel::Error, tag() + "reply failed", err);
        failure = err;
        break;
    }

    if (speak && !failure && !m_cancel.isCancelled()) {
        if (auto rest = sentences.flush(); rest.has_value()) m_sentences->push(std::move(*rest));
    }
    m_sentences->close();
    if (m_synthesizer.joinable()) m_synthesizer.join();

    complete(failure);
}

void Turn::synthesisLoop() {
    std::string sentence;
    while (m_sentences->pop(sentence)) {
        if (m_cancel.isCancelled()) break;
        std::vector<uint8_t> audio;
        ErrorInfo err;
        if (m_ctx.synthesizer->synthesize(sentence, m_cancel, audio, &err)) {
            m_audioRelay.offer(audio);
        } else if (!m_cancel.isCancelled()) {
            m_ctx.errorHandler.log(LogLevel::Warning, tag() + "speech synthesis failed, sentence sent as text only", err);
        }
    }
}

void Turn::complete(const std::optional<ErrorInfo>& failure) {
    m_textRelay.close();
    if (m_cancel.isCancelled()) {
        m_audioRelay.discard();
    } else {
        m_audioRelay.close();
        bool delivered = true;
        if (failure.has_value()) {
            delivered = m_ctx.sink.submit(OutboundPacket::makeText(PacketKind::Error, m_id, failure->message));
        }
        delivered = m_ctx.sink.submit(OutboundPacket::makeText(PacketKind::TurnComplete, m_id, "")) && delivered;
        if (!delivered) {
            m_ctx.errorHandler.log(LogLevel::Debug, tag() + "sink closed, turn completion not delivered");
        }
    }
    m_state.store(TurnState::Closed);
    m_ctx.errorHandler.log(LogLevel::Debug, tag() + "closed");
    if (m_onDone) m_onDone(m_id, failure);
}

} // namespace talkback::server
