#include "talkback/server/DeepgramTts.h"

#include "talkback/server/ErrorHandler.h"
#include "talkback/server/utils/HttpClient.h"

#include <memory>

namespace talkback::server {

using talkback::server::utils::HttpClient;
using talkback::server::utils::HttpMethod;
using talkback::server::utils::HttpRequest;

DeepgramTts::DeepgramTts(const ConfigManager& cfg)
    : m_baseUrl(cfg.getString("tts.base_url", "https://api.deepgram.com/v1/speak"))
    , m_apiKey(cfg.getString("tts.api_key", ""))
    , m_model(cfg.getString("tts.model", "aura-asteria-en"))
    , m_encoding(cfg.getString("tts.encoding", "mp3"))
    , m_timeoutMs(static_cast<int>(cfg.getInt("tts.timeout_ms", 30000)))
{
    if (m_timeoutMs <= 0) m_timeoutMs = 30000;
}

std::string DeepgramTts::requestUrl() const {
    HttpRequest probe;
    probe.url = m_baseUrl;
    probe.setParam("model", m_model);
    probe.setParam("encoding", m_encoding);
    return probe.buildUrl();
}

bool DeepgramTts::synthesize(const std::string& text,
                             const utils::CancelToken& cancel,
                             std::vector<uint8_t>& out,
                             ErrorInfo* err) {
    auto client = std::make_shared<HttpClient>(m_baseUrl);
    client->setTimeout(m_timeoutMs);

    HttpRequest hreq;
    hreq.method = HttpMethod::POST;
    hreq.url = m_baseUrl;
    hreq.setParam("model", m_model);
    hreq.setParam("encoding", m_encoding);
    hreq.body = nlohmann::json{{"text", text}}.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    hreq.timeoutMs = m_timeoutMs;
    if (!m_apiKey.empty()) hreq.headers["Authorization"] = "Token " + m_apiKey;
    hreq.headers["Content-Type"] = "application/json";

    std::weak_ptr<HttpClient> weak = client;
    cancel.onCancel([weak]() {
        if (auto c = weak.lock()) c->stop();
    });

    const size_t before = out.size();
    hreq.streamHandler = [&](std::string_view chunk) {
        if (cancel.isCancelled()) return false;
        out.insert(out.end(), chunk.begin(), chunk.end());
        return true;
    };

    const auto resp = client->executeStream(hreq);
    if (cancel.isCancelled()) {
        out.resize(before);
        if (err) *err = ErrorInfo::make(ErrorType::UnknownError, "synthesis cancelled");
        return false;
    }
    if (!resp.isSuccess() || !resp.error.empty()) {
        out.resize(before);
        if (err) {
            *err = ErrorHandler::fromHttpResponse(resp, std::optional<HttpRequest>{hreq});
            err->addContext("model", m_model);
            err->addContext("endpoint", "/v1/speak");
        }
        return false;
    }
    return true;
}

} // namespace talkback::server
