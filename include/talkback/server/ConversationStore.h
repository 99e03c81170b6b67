#pragma once

#include "talkback/server/types/ChatTypes.h"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace talkback::server {

/**
 * @brief 按 conversationId 保存的对话历史（进程内，线程安全）
 *
 * 每个对话只保留最近 maxMessages 条消息；多个会话可共享同一实例。
 */
class ConversationStore {
public:
    explicit ConversationStore(size_t maxMessages = 20);

    ConversationStore(const ConversationStore&) = delete;
    ConversationStore& operator=(const ConversationStore&) = delete;

    // 记录一次完整的问答
    void appendExchange(const std::string& conversationId,
                        const std::string& userText,
                        const std::string& assistantText);

    void addMessage(const std::string& conversationId, const types::ChatMessage& message);

    // 最近的历史消息（时间正序）
    std::vector<types::ChatMessage> history(const std::string& conversationId) const;

    void clear(const std::string& conversationId);

    size_t conversationCount() const;
    size_t maxMessages() const { return m_maxMessages; }

private:
    void trimLocked(std::deque<types::ChatMessage>& messages) const;

    const size_t m_maxMessages;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::deque<types::ChatMessage>> m_conversations;
};

} // namespace talkback::server
