#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace talkback::server::types {

enum class MessageRole {
    System,
    User,
    Assistant
};

inline const char* roleName(MessageRole r) {
    switch (r) {
        case MessageRole::System: return "system";
        case MessageRole::Assistant: return "assistant";
        case MessageRole::User: break;
    }
    return "user";
}

/**
 * @brief 对话历史中的一条消息
 */
struct ChatMessage {
    MessageRole role{MessageRole::User};
    std::string content;

    ChatMessage() = default;
    ChatMessage(MessageRole r, std::string text) : role(r), content(std::move(text)) {}
};

/**
 * @brief 流式 chat/completions 请求体
 *
 * 可选参数未设置时不写入 JSON，由服务端使用默认值。
 */
struct ChatRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    std::optional<float> temperature;
    std::optional<uint32_t> maxTokens;
    bool stream{true};

    nlohmann::json toJson() const {
        nlohmann::json body{{"model", model}, {"stream", stream}};
        auto& arr = body["messages"] = nlohmann::json::array();
        for (const auto& m : messages) {
            arr.push_back({{"role", roleName(m.role)}, {"content", m.content}});
        }
        if (temperature) body["temperature"] = *temperature;
        if (maxTokens) body["max_tokens"] = *maxTokens;
        return body;
    }
};

// 一次回复结束后的汇总
struct ChatResponse {
    std::string content;
    std::optional<std::string> finishReason;
    std::optional<std::string> model;
};

} // namespace talkback::server::types
