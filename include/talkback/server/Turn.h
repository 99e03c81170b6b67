#pragma once

#include "talkback/server/ConfigManager.h"
#include "talkback/server/ErrorHandler.h"
#include "talkback/server/OutboundSink.h"
#include "talkback/server/Relays.h"
#include "talkback/server/Responder.h"
#include "talkback/server/SttStream.h"
#include "talkback/server/TranscriptAggregator.h"
#include "talkback/server/utils/CancelToken.h"
#include "talkback/server/utils/Channel.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace talkback::server {

enum class TurnState {
    Listening,
    Finalizing,
    Responding,
    Closed
};

const char* turnStateToString(TurnState s);

/**
 * @brief Turn 编排参数（对应配置 turn.* 与 llm.max_retries）
 */
struct TurnSettings {
    std::chrono::milliseconds finalizeTimeout{5000};
    size_t pendingFrameLimit{256};
    uint32_t sttOpenRetries{3};
    uint32_t sttRetryInitialDelayMs{250};
    uint32_t responderRetries{1};

    static TurnSettings fromConfig(const ConfigManager& cfg);
};

/**
 * @brief 会话内所有 Turn 共享的协作者
 */
struct TurnContext {
    OutboundSink& sink;
    SttProvider& stt;
    Responder& responder;
    SpeechSynthesizer* synthesizer{nullptr};  // 为空时只回复文本
    const ErrorHandler& errorHandler;
    TurnSettings settings;
    std::string sessionId;
};

/**
 * @brief 一次完整的“用户说话 -> 系统回复”
 *
 * 持有本 Turn 的 STT 流、取消信号、转写聚合器与三个中继（用户转写、回复文本、回复音频）。
 * 状态只向前推进：Listening -> Finalizing -> Responding -> Closed（空话语时跳过 Responding）。
 *
 * 线程：
 * - STT 读线程：唯一写聚合器的线程，首次打开 STT 流时启动；
 * - 回复线程：运行 LLM 调用，并在结束时关闭中继、置为 Closed、回调 onDone；
 * - 合成线程：经句子通道接收回复文本，逐句合成音频。
 * 析构前会取消并 join 全部线程。
 */
class Turn {
public:
    // failure 为空表示正常结束
    using DoneCallback = std::function<void(uint64_t turnId, const std::optional<ErrorInfo>& failure)>;

    Turn(uint64_t id, const TurnContext& ctx, DoneCallback onDone);
    ~Turn();

    Turn(const Turn&) = delete;
    Turn& operator=(const Turn&) = delete;

    uint64_t id() const { return m_id; }
    TurnState state() const { return m_state.load(); }
    bool hasSttStream() const { return static_cast<bool>(m_stt); }

    /**
     * @brief 送入一段用户音频；首次调用时打开 STT 流
     *
     * 打开失败按退避策略重试；写失败时重连一次并重发。
     * @throws SessionError 重试耗尽或重连失败
     */
    void sendAudio(const std::string& audio);

    /**
     * @brief Listening -> Finalizing：请求 flush 并等待聚合屏障，随后关闭 STT 流
     */
    TranscriptAggregator::Result finalize();

    /**
     * @brief Listening -> Finalizing：直接文本输入，丢弃尚未完成的语音转写
     */
    void beginDirectText();

    /**
     * @brief Finalizing -> Responding：启动回复线程
     */
    void respond(std::string utterance, std::string conversationId);

    /**
     * @brief Finalizing -> Closed：空话语，不调用 LLM
     */
    void closeEmpty();

    void cancel();

    // 关闭 STT 流并 join 所有线程；只由会话线程调用
    void join();

private:
    std::string tag() const;

    void openStt();
    std::unique_ptr<SttStream> openStream(uint32_t generation, ErrorInfo* err);
    void closeStt();
    void sttReaderLoop();
    void responderLoop(std::string utterance, std::string conversationId);
    void synthesisLoop();
    void complete(const std::optional<ErrorInfo>& failure);

    const uint64_t m_id;
    TurnContext m_ctx;
    DoneCallback m_onDone;
    ErrorHandler m_sttRetry;
    ErrorHandler m_responderRetry;

    std::atomic<TurnState> m_state{TurnState::Listening};
    utils::CancelToken m_cancel;

    std::unique_ptr<SttStream> m_stt;
    uint32_t m_sttGeneration{0};
    std::shared_ptr<utils::Channel<SttEvent>> m_sttEvents;
    // 任一代 STT 流是否已产出过片段
    std::shared_ptr<std::atomic<bool>> m_heardSpeech;
    std::shared_ptr<utils::Channel<std::string>> m_sentences;

    TranscriptAggregator m_aggregator;
    TextRelay m_transcriptRelay;
    TextRelay m_textRelay;
    AudioRelay m_audioRelay;

    std::thread m_sttReader;
    std::thread m_responder;
    std::thread m_synthesizer;
};

} // namespace talkback::server
