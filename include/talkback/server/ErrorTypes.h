#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

namespace talkback::server {

enum class ErrorType {
    NetworkError,     // 连接失败、DNS、上游 WebSocket 断开
    RateLimitError,   // 429
    InvalidRequest,   // 其余 4xx，或配置/参数错误
    ServerError,      // 5xx
    TimeoutError,     // 408 或本地超时
    ProtocolError,    // 客户端消息格式错误
    TransportError,   // 客户端连接读写失败
    UnknownError
};

/**
 * @brief 结构化错误信息
 *
 * 日志与客户端错误包都由它生成；context 只放定位用的短字段（session_id、turn_id、model 等），
 * 不放密钥。
 */
struct ErrorInfo {
    ErrorType errorType{ErrorType::UnknownError};
    int errorCode{0}; // HTTP status 或 0
    std::string message;
    std::optional<nlohmann::json> details;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::optional<std::map<std::string, std::string>> context;

    static ErrorInfo make(ErrorType t, std::string msg, int code = 0) {
        ErrorInfo info;
        info.errorType = t;
        info.errorCode = code;
        info.message = std::move(msg);
        return info;
    }

    static const char* errorTypeToString(ErrorType t) {
        switch (t) {
            case ErrorType::NetworkError: return "NetworkError";
            case ErrorType::RateLimitError: return "RateLimitError";
            case ErrorType::InvalidRequest: return "InvalidRequest";
            case ErrorType::ServerError: return "ServerError";
            case ErrorType::TimeoutError: return "TimeoutError";
            case ErrorType::ProtocolError: return "ProtocolError";
            case ErrorType::TransportError: return "TransportError";
            case ErrorType::UnknownError: break;
        }
        return "UnknownError";
    }

    // 空值不记录
    void addContext(const std::string& key, const std::string& value) {
        if (value.empty()) return;
        if (!context) context.emplace();
        (*context)[key] = value;
    }

    nlohmann::json toJson() const {
        nlohmann::json j{
            {"error_type", errorTypeToString(errorType)},
            {"error_code", errorCode},
            {"message", message},
            {"timestamp_ms", std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count()},
        };
        if (details) j["details"] = *details;
        if (context) j["context"] = *context;
        return j;
    }

    // details 可能带有客户端或上游的原始字节，非法 UTF-8 替换为 U+FFFD，不抛异常
    std::string toString() const {
        return toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
};

/**
 * @brief 会话级致命错误
 *
 * 由 Turn / TurnController 抛出，Session 捕获后拆除整个会话。
 */
class SessionError : public std::runtime_error {
public:
    explicit SessionError(const ErrorInfo& info)
        : std::runtime_error(info.message)
        , m_info(info)
    {}

    const ErrorInfo& errorInfo() const { return m_info; }

private:
    ErrorInfo m_info;
};

} // namespace talkback::server
