#include "talkback/server/utils/HttpClient.h"
#include "talkback/server/utils/HttpSerialization.h"

// HTTPS 由构建层定义 CPPHTTPLIB_OPENSSL_SUPPORT 开启
#include "httplib.h"

namespace talkback::server::utils {

std::string HttpRequest::buildUrl() const {
    if (params.empty()) return url;
    return url + (url.find('?') == std::string::npos ? '?' : '&') + serializeQuery(params);
}

std::optional<nlohmann::json> HttpResponse::asJson(std::string* error) const {
    return parseJsonSafe(body, error);
}

HttpClient::HttpClient(std::string baseUrl)
    : m_baseUrl(std::move(baseUrl))
{}

HttpClient::~HttpClient() = default;

void HttpClient::setDefaultHeader(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_defaultHeaders[key] = value;
}

std::pair<std::string, std::string> HttpClient::splitUrl(const std::string& url) {
    const auto scheme = url.find("://");
    const auto slash = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (slash == std::string::npos) return {url, "/"};
    return {url.substr(0, slash), url.substr(slash)};
}

std::map<std::string, std::string> HttpClient::mergeHeaders(
    const std::map<std::string, std::string>& requestHeaders) const {
    std::lock_guard<std::mutex> lk(m_mu);
    auto merged = requestHeaders;
    // insert 不覆盖已有键：请求级头优先
    merged.insert(m_defaultHeaders.begin(), m_defaultHeaders.end());
    return merged;
}

std::shared_ptr<httplib::Client> HttpClient::connect(const std::string& origin, int readTimeoutMs) {
    std::lock_guard<std::mutex> lk(m_mu);
    if (m_stopped) return nullptr;

    // httplib::Client 依据 scheme 选择 http/https
    m_client = std::make_shared<httplib::Client>(origin);
    m_client->set_connection_timeout(m_connectTimeout);
    m_client->set_read_timeout(std::chrono::milliseconds(readTimeoutMs));
    m_client->set_write_timeout(std::chrono::seconds(5));
    m_client->set_follow_location(true);
    return m_client;
}

HttpResponse HttpClient::executeStream(const HttpRequest& request) {
    HttpResponse response;

    // 未指定 url 时请求 baseUrl 本身
    HttpRequest target = request;
    if (target.url.empty()) target.url = m_baseUrl;
    const auto [origin, pathWithQuery] = splitUrl(target.buildUrl());

    auto client = connect(origin, request.timeoutMs > 0 ? request.timeoutMs : m_timeoutMs);
    if (!client) {
        response.error = "cancelled";
        return response;
    }

    httplib::Request req;
    req.method = methodName(request.method);
    req.path = pathWithQuery;
    for (const auto& [key, value] : mergeHeaders(request.headers)) {
        req.headers.emplace(key, value);
    }
    req.body = request.body;

    bool aborted = false;
    req.response_handler = [&response](const httplib::Response& r) {
        response.statusCode = r.status;
        for (const auto& [key, value] : r.headers) response.headers.add(key, value);
        return true;
    };
    req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        if (!response.isSuccess()) {
            // 错误响应的正文留给 ErrorHandler 解析
            response.body.append(data, len);
            return true;
        }
        if (request.streamHandler && !request.streamHandler(std::string_view(data, len))) {
            aborted = true;
            return false;
        }
        return true;
    };

    try {
        auto result = client->send(req);
        if (aborted) {
            response.error = "cancelled";
        } else if (!result) {
            response.statusCode = 0;
            response.error = "Request failed: " + httplib::to_string(result.error());
        }
    } catch (const std::exception& e) {
        response.statusCode = 0;
        response.error = std::string("Exception: ") + e.what();
    }
    return response;
}

void HttpClient::stop() {
    std::lock_guard<std::mutex> lk(m_mu);
    m_stopped = true;
    if (m_client) m_client->stop();
}

} // namespace talkback::server::utils
