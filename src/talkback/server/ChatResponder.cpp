#include "talkback/server/ChatResponder.h"

namespace talkback::server {

using types::ChatMessage;
using types::MessageRole;

ChatResponder::ChatResponder(LlmClient& client, ConversationStore& store)
    : m_client(client)
    , m_store(store)
{}

std::vector<ChatMessage> ChatResponder::buildMessages(const std::string& utterance,
                                                      const std::string& conversationId) const {
    std::vector<ChatMessage> messages;
    const auto systemPrompt = m_client.getSystemPrompt();
    if (!systemPrompt.empty()) {
        messages.emplace_back(MessageRole::System, systemPrompt);
    }
    for (auto& m : m_store.history(conversationId)) {
        messages.push_back(std::move(m));
    }
    messages.emplace_back(MessageRole::User, utterance);
    return messages;
}

bool ChatResponder::streamReply(const std::string& utterance,
                                const std::string& conversationId,
                                const utils::CancelToken& cancel,
                                const TextCallback& onText,
                                ErrorInfo* err) {
    auto req = m_client.makeRequest(buildMessages(utterance, conversationId));

    std::string reply;
    LlmClient::Callbacks cb;
    cb.onTextDelta = [&](std::string_view delta) {
        reply.append(delta.data(), delta.size());
        if (onText) onText(delta);
    };

    try {
        if (!m_client.chatStream(req, std::move(cb), &cancel)) {
            if (err) *err = ErrorInfo::make(ErrorType::UnknownError, "reply cancelled");
            return false;
        }
    } catch (const LlmClient::LlmClientError& e) {
        if (err) {
            *err = e.errorInfo();
            err->addContext("conversation_id", conversationId);
        }
        return false;
    }

    m_store.appendExchange(conversationId, utterance, reply);
    return true;
}

} // namespace talkback::server
