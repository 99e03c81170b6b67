#pragma once

#include "talkback/server/Turn.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace talkback::server {

/**
 * @brief 会话内 Turn 生命周期的唯一管理者
 *
 * 任意时刻只有一个当前 Turn。当前 Turn 报告 Closed（经会话事件通道回到会话线程）后，
 * onTurnClosed() 才会 join 它并接上新的 Listening Turn，因此两个 Turn 的包不会在 Sink 上交错。
 * 除回调外的所有方法只能由会话线程调用。
 */
class TurnController {
public:
    // 在 Turn 的回复线程（或会话线程）上调用
    using TurnDoneCallback = std::function<void(uint64_t turnId, const std::optional<ErrorInfo>& failure)>;

    TurnController(TurnContext ctx, TurnDoneCallback onTurnDone);
    ~TurnController();

    TurnController(const TurnController&) = delete;
    TurnController& operator=(const TurnController&) = delete;

    TurnState state() const;
    uint64_t currentTurnId() const;

    // 当前 Turn 不在 Listening 时为 true，此时到达的输入需由会话缓存
    bool isBusy() const;

    /**
     * @brief 转发音频到当前 Turn 的 STT 流
     * @throws SessionError STT 不可恢复
     */
    void onAudio(const std::string& audio);

    /**
     * @brief 结束语音输入：等待完整话语，空话语直接关闭 Turn，否则开始回复
     */
    TranscriptAggregator::Result endOfInput(const std::string& conversationId);

    /**
     * @brief 直接文本输入，视为已确定的话语
     */
    void submitText(const std::string& text, const std::string& conversationId);

    /**
     * @brief 当前 Turn 已 Closed：join 并接上新 Turn；过期的 turnId 被忽略
     * @return 是否发生了重新接线
     */
    bool onTurnClosed(uint64_t turnId);

    // 取消并 join 当前 Turn；之后不再接受输入
    void shutdown();

private:
    void wireNextTurn();
    Turn& current();

    TurnContext m_ctx;
    TurnDoneCallback m_onTurnDone;
    uint64_t m_nextTurnId{1};
    std::unique_ptr<Turn> m_turn;
};

} // namespace talkback::server
