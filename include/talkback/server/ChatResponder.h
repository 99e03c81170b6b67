#pragma once

#include "talkback/server/ConversationStore.h"
#include "talkback/server/LlmClient.h"
#include "talkback/server/Responder.h"

#include <string>

namespace talkback::server {

/**
 * @brief 基于 LlmClient 的回复生成
 *
 * messages = [system prompt] + 对话历史 + 本次话语；回复完整结束后才写回历史，
 * 被取消或失败的回复不进入历史。
 */
class ChatResponder : public Responder {
public:
    ChatResponder(LlmClient& client, ConversationStore& store);

    bool streamReply(const std::string& utterance,
                     const std::string& conversationId,
                     const utils::CancelToken& cancel,
                     const TextCallback& onText,
                     ErrorInfo* err = nullptr) override;

    // 构造本次请求的 messages（便于测试）
    std::vector<types::ChatMessage> buildMessages(const std::string& utterance,
                                                  const std::string& conversationId) const;

private:
    LlmClient& m_client;
    ConversationStore& m_store;
};

} // namespace talkback::server
