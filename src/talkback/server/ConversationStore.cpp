#include "talkback/server/ConversationStore.h"

namespace talkback::server {

using types::ChatMessage;
using types::MessageRole;

ConversationStore::ConversationStore(size_t maxMessages)
    : m_maxMessages(maxMessages)
{}

void ConversationStore::appendExchange(const std::string& conversationId,
                                       const std::string& userText,
                                       const std::string& assistantText) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& messages = m_conversations[conversationId];
    messages.emplace_back(MessageRole::User, userText);
    messages.emplace_back(MessageRole::Assistant, assistantText);
    trimLocked(messages);
}

void ConversationStore::addMessage(const std::string& conversationId, const ChatMessage& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& messages = m_conversations[conversationId];
    messages.push_back(message);
    trimLocked(messages);
}

std::vector<ChatMessage> ConversationStore::history(const std::string& conversationId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_conversations.find(conversationId);
    if (it == m_conversations.end()) {
        return {};
    }
    return std::vector<ChatMessage>(it->second.begin(), it->second.end());
}

void ConversationStore::clear(const std::string& conversationId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_conversations.erase(conversationId);
}

size_t ConversationStore::conversationCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_conversations.size();
}

void ConversationStore::trimLocked(std::deque<ChatMessage>& messages) const {
    if (messages.size() <= m_maxMessages) {
        return;
    }
    // 保留最近的 N 条
    const size_t removeCount = messages.size() - m_maxMessages;
    messages.erase(messages.begin(), messages.begin() + static_cast<std::ptrdiff_t>(removeCount));
}

} // namespace talkback::server
