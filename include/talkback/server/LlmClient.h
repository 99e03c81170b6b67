#pragma once

#include "talkback/server/ConfigManager.h"
#include "talkback/server/ErrorTypes.h"
#include "talkback/server/types/ChatTypes.h"
#include "talkback/server/utils/CancelToken.h"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace talkback::server {

/**
 * @brief OpenAI 兼容的 Chat Completions 客户端（SSE 流式）
 *
 * 默认指向 Groq（llm.base_url）。只实现流式接口：回复增量经 onTextDelta 逐段交出。
 */
class LlmClient {
public:
    struct Callbacks {
        std::function<void(std::string_view)> onTextDelta;
        std::function<void(const types::ChatResponse&)> onComplete;
        std::function<void(const ErrorInfo&)> onError;
    };

    class LlmClientError : public std::runtime_error {
    public:
        explicit LlmClientError(const ErrorInfo& info);
        const ErrorInfo& errorInfo() const { return m_info; }

    private:
        ErrorInfo m_info;
    };

    explicit LlmClient(const ConfigManager& cfg);
    ~LlmClient() = default;

    LlmClient(const LlmClient&) = delete;
    LlmClient& operator=(const LlmClient&) = delete;

    // 按配置填充 model/temperature/max_tokens，stream 置为 true
    types::ChatRequest makeRequest(std::vector<types::ChatMessage> messages) const;

    /**
     * @brief SSE 流式调用，阻塞直到完成、出错或被取消
     * @return 正常完成返回 true；被取消返回 false（不触发 onError）
     * @throws LlmClientError HTTP 错误或网络错误
     */
    bool chatStream(const types::ChatRequest& req, Callbacks cb, const utils::CancelToken* cancel = nullptr);

    // ========== 便于测试/诊断 ==========
    std::string getBaseUrl() const { return m_baseUrl; }
    std::string getApiKeyRedacted() const;
    std::string getModel() const { return m_model; }
    std::string getSystemPrompt() const { return m_systemPrompt; }
    int getDefaultTimeoutMs() const { return m_timeoutMs; }

private:
    std::string m_baseUrl;
    std::string m_apiKey;
    std::string m_model;
    std::string m_systemPrompt;
    std::optional<float> m_temperature;
    std::optional<uint32_t> m_maxTokens;
    int m_timeoutMs{30000};
};

/**
 * @brief 流式 chunk 的聚合：抽取 choices[0].delta.content，并记录 finish_reason/model
 */
class ChatStreamAggregator {
public:
    explicit ChatStreamAggregator(LlmClient::Callbacks cb) : m_cb(std::move(cb)) {}

    void onChunkJson(const nlohmann::json& j);
    void onDone();
    void onError(const ErrorInfo& info);

    bool completed() const { return m_completed; }
    types::ChatResponse result() const;

private:
    LlmClient::Callbacks m_cb;
    std::string m_content;
    std::optional<std::string> m_finishReason;
    std::optional<std::string> m_model;
    bool m_completed{false};
};

} // namespace talkback::server
