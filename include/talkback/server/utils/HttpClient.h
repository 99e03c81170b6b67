#pragma once

#include "talkback/server/utils/HttpTypes.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace httplib {
    class Client;
}

namespace talkback::server::utils {

/**
 * @brief 基于 cpp-httplib 的流式 HTTP 客户端
 *
 * 每次上游调用（一次 LLM 回复、一句 TTS）使用一个实例，stop() 用于在取消时打断阻塞的读取。
 * 不做重试：流式正文一旦交给回调便无法重放，重试由调用方按 ErrorHandler 的策略决定。
 */
class HttpClient {
public:
    explicit HttpClient(std::string baseUrl);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void setDefaultHeader(const std::string& key, const std::string& value);

    // 读超时（毫秒），请求未单独指定时使用
    void setTimeout(int timeoutMs) { m_timeoutMs = timeoutMs; }

    void setConnectTimeout(std::chrono::milliseconds timeout) { m_connectTimeout = timeout; }

    /**
     * @brief 发送请求，2xx 响应的正文按块交给 request.streamHandler
     *
     * 回调返回 false 时中止传输，返回的 HttpResponse.error 为 "cancelled"。
     * 非 2xx 响应的正文写入 HttpResponse.body，便于错误映射。
     */
    HttpResponse executeStream(const HttpRequest& request);

    // 可从其他线程调用；之后的 executeStream 立即以传输错误返回
    void stop();

    // 拆分为 (scheme://host[:port], path?query)
    static std::pair<std::string, std::string> splitUrl(const std::string& url);

private:
    friend class HttpClientTestAccessor;

    std::shared_ptr<httplib::Client> connect(const std::string& origin, int readTimeoutMs);
    std::map<std::string, std::string> mergeHeaders(const std::map<std::string, std::string>& requestHeaders) const;

    const std::string m_baseUrl;
    int m_timeoutMs{30000};
    std::chrono::milliseconds m_connectTimeout{10000};

    mutable std::mutex m_mu;
    std::map<std::string, std::string> m_defaultHeaders;
    std::shared_ptr<httplib::Client> m_client;
    bool m_stopped{false};
};

} // namespace talkback::server::utils
