#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

namespace talkback::server::utils {

enum class HttpMethod {
    GET,
    POST
};

inline const char* methodName(HttpMethod m) {
    return m == HttpMethod::POST ? "POST" : "GET";
}

/**
 * @brief 流式响应正文回调
 *
 * 返回 false 表示中止传输（例如 Turn 已被取消）。
 */
using StreamHandler = std::function<bool(std::string_view chunk)>;

struct HttpRequest {
    HttpMethod method{HttpMethod::GET};
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeoutMs{30000};

    // 追加到 url 的 query 参数
    std::map<std::string, std::string> params;

    StreamHandler streamHandler;

    void setParam(const std::string& key, const std::string& value) { params[key] = value; }

    // url + 编码后的 params；url 已带 query 时用 '&' 追加
    std::string buildUrl() const;
};

/**
 * @brief 响应头，键不区分大小写，同名多值按到达顺序保留
 */
class HttpHeaders {
public:
    void add(const std::string& key, const std::string& value) { m_entries[fold(key)].push_back(value); }

    bool has(const std::string& key) const { return m_entries.count(fold(key)) > 0; }

    std::optional<std::string> getFirst(const std::string& key) const {
        auto it = m_entries.find(fold(key));
        if (it == m_entries.end() || it->second.empty()) return std::nullopt;
        return it->second.front();
    }

    std::optional<std::string> contentType() const { return getFirst("content-type"); }

private:
    static std::string fold(std::string s) {
        for (auto& c : s) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        return s;
    }

    std::map<std::string, std::vector<std::string>> m_entries;
};

struct HttpResponse {
    int statusCode{0};  // 0 表示传输层失败，原因见 error
    HttpHeaders headers;
    std::string body;   // 流式请求只在非 2xx 时填充
    std::string error;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }

    std::optional<std::string> getHeader(const std::string& key) const { return headers.getFirst(key); }

    bool isJson() const {
        auto ct = headers.contentType();
        return ct && ct->find("application/json") != std::string::npos;
    }

    std::optional<nlohmann::json> asJson(std::string* error = nullptr) const;
};

} // namespace talkback::server::utils
