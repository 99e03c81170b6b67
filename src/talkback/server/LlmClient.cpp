#include "talkback/server/LlmClient.h"

#include "talkback/server/ErrorHandler.h"
#include "talkback/server/utils/HttpClient.h"
#include "talkback/server/utils/HttpTypes.h"
#include "talkback/server/utils/SseDecoder.h"

#include <memory>
#include <mutex>
#include <utility>

namespace talkback::server {

using talkback::server::types::ChatRequest;
using talkback::server::types::ChatResponse;
using talkback::server::utils::HttpClient;
using talkback::server::utils::HttpMethod;
using talkback::server::utils::HttpRequest;
using talkback::server::utils::HttpResponse;

namespace {

const char* const kEndpoint = "/chat/completions";

// base_url 可带或不带结尾的 '/'
std::string endpointUrl(std::string base) {
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + kEndpoint;
}

} // namespace

LlmClient::LlmClientError::LlmClientError(const ErrorInfo& info)
    : std::runtime_error(info.toString())
    , m_info(info)
{}

LlmClient::LlmClient(const ConfigManager& cfg)
    : m_baseUrl(cfg.getString("llm.base_url", "https://api.groq.com/openai/v1"))
    , m_apiKey(cfg.getString("llm.api_key", ""))
    , m_model(cfg.getString("llm.model", "llama3-8b-8192"))
    , m_systemPrompt(cfg.getString("llm.system_prompt", ""))
{
    // 类型不对或非正数时不发送，交给服务端默认值
    if (auto t = cfg.get("llm.temperature"); t && t->is_number()) m_temperature = t->get<float>();
    if (const auto n = cfg.getInt("llm.max_tokens", 0); n > 0) m_maxTokens = static_cast<uint32_t>(n);

    const auto timeout = cfg.getInt("llm.timeout_ms", m_timeoutMs);
    if (timeout > 0) m_timeoutMs = static_cast<int>(timeout);
}

std::string LlmClient::getApiKeyRedacted() const {
    return ConfigManager::redactSensitive("llm.api_key", m_apiKey);
}

ChatRequest LlmClient::makeRequest(std::vector<types::ChatMessage> messages) const {
    ChatRequest req;
    req.model = m_model;
    req.messages = std::move(messages);
    req.temperature = m_temperature;
    req.maxTokens = m_maxTokens;
    return req;
}

bool LlmClient::chatStream(const ChatRequest& req, Callbacks cb, const utils::CancelToken* cancel) {
    auto client = std::make_shared<HttpClient>(m_baseUrl);
    client->setTimeout(m_timeoutMs);

    HttpRequest hreq;
    hreq.method = HttpMethod::POST;
    hreq.url = endpointUrl(m_baseUrl);
    hreq.body = req.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    hreq.timeoutMs = m_timeoutMs;
    if (!m_apiKey.empty()) hreq.headers["Authorization"] = "Bearer " + m_apiKey;
    hreq.headers["Content-Type"] = "application/json";
    hreq.headers["Accept"] = "text/event-stream";

    if (cancel) {
        // 取消时打断阻塞中的读取；回调可能晚于本函数返回，只持弱引用
        std::weak_ptr<HttpClient> weak = client;
        cancel->onCancel([weak]() {
            if (auto c = weak.lock()) c->stop();
        });
    }

    utils::SseDecoder decoder;
    ChatStreamAggregator agg(std::move(cb));
    std::mutex mu;

    hreq.streamHandler = [&](std::string_view chunk) {
        if (cancel && cancel->isCancelled()) return false;
        std::lock_guard<std::mutex> lk(mu);
        decoder.feed(chunk);
        for (auto& ev : decoder.drain()) {
            if (ev.done) {
                agg.onDone();
                continue;
            }
            if (ev.data.empty()) continue;
            auto j = nlohmann::json::parse(ev.data, nullptr, false);
            // 个别供应商会夹带 keep-alive 或非 JSON 行，跳过
            if (j.is_discarded()) continue;
            agg.onChunkJson(j);
        }
        return true;
    };

    const auto resp = client->executeStream(hreq);
    if (cancel && cancel->isCancelled()) {
        return false;
    }
    if (!resp.isSuccess() || !resp.error.empty()) {
        // 请求头含 api key，不进入 ErrorInfo
        auto info = ErrorHandler::fromHttpResponse(resp, std::optional<HttpRequest>{hreq});
        info.addContext("model", req.model);
        info.addContext("endpoint", kEndpoint);
        agg.onError(info);
        throw LlmClientError(info);
    }

    // 服务端未发送 [DONE] 时也视为完成
    if (!agg.completed()) agg.onDone();
    return true;
}

// ========== ChatStreamAggregator ==========

void ChatStreamAggregator::onChunkJson(const nlohmann::json& j) {
    if (!j.is_object()) return;
    if (auto m = j.find("model"); m != j.end() && m->is_string()) m_model = m->get<std::string>();

    auto choices = j.find("choices");
    if (choices == j.end() || !choices->is_array() || choices->empty()) return;
    const auto& choice = choices->front();
    if (!choice.is_object()) return;

    if (auto fr = choice.find("finish_reason"); fr != choice.end() && fr->is_string()) {
        m_finishReason = fr->get<std::string>();
    }

    // 流式为 delta；部分兼容实现在最后一块给出完整 message
    auto delta = choice.find("delta");
    if (delta == choice.end() || !delta->is_object()) delta = choice.find("message");
    if (delta == choice.end() || !delta->is_object()) return;

    auto content = delta->find("content");
    if (content == delta->end() || !content->is_string()) return;
    const auto& piece = content->get_ref<const std::string&>();
    if (piece.empty()) return;
    m_content += piece;
    if (m_cb.onTextDelta) m_cb.onTextDelta(std::string_view{piece});
}

void ChatStreamAggregator::onDone() {
    if (m_completed) return;
    m_completed = true;
    if (m_cb.onComplete) m_cb.onComplete(result());
}

void ChatStreamAggregator::onError(const ErrorInfo& info) {
    if (m_cb.onError) m_cb.onError(info);
}

ChatResponse ChatStreamAggregator::result() const {
    ChatResponse r;
    r.content = m_content;
    r.finishReason = m_finishReason;
    r.model = m_model;
    return r;
}

} // namespace talkback::server
