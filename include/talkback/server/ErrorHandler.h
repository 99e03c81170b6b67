#pragma once

#include "talkback/server/ErrorTypes.h"
#include "talkback/server/utils/HttpTypes.h"

#include <cstdint>
#include <optional>
#include <string>

namespace talkback::server {

/**
 * @brief 错误识别、重试策略与日志
 *
 * 日志为单行结构化输出到 stderr：`[epoch_ms] LEVEL message {error json}`。
 * 每个会话持有一个实例，并以引用方式传给其下所有组件。
 */
class ErrorHandler {
public:
    /**
     * @brief 重试退避参数
     *
     * 每种错误类型能重试几次由 retryCap() 决定，maxRetries 只是其中的统一上限。
     */
    struct RetryPolicy {
        uint32_t maxRetries{3};
        uint32_t initialDelayMs{1000};
        double backoffMultiplier{2.0};
        uint32_t maxDelayMs{30000};
        bool enableJitter{true};

        static RetryPolicy makeDefault() { return RetryPolicy{}; }
    };

    enum class LogLevel {
        Error,
        Warning,
        Info,
        Debug
    };

    struct LoggerConfig {
        LogLevel minLevel{LogLevel::Info};
        bool enabled{true};
    };

    ErrorHandler() = default;
    explicit ErrorHandler(RetryPolicy policy) : m_policy(policy) {}

    void setRetryPolicy(RetryPolicy policy) { m_policy = policy; }
    const RetryPolicy& getRetryPolicy() const { return m_policy; }

    void setLoggerConfig(LoggerConfig cfg) { m_loggerCfg = cfg; }
    const LoggerConfig& getLoggerConfig() const { return m_loggerCfg; }

    // ========== 错误识别 ==========
    // statusCode 为 0 表示传输层失败，此时根据 transportError 文案区分超时与网络错误
    static ErrorType mapHttpStatusToErrorType(int statusCode, const std::string& transportError = "");

    // 从 HTTP 响应生成 ErrorInfo；只记录 url/method，不记录请求头
    static ErrorInfo fromHttpResponse(
        const utils::HttpResponse& resp,
        const std::optional<utils::HttpRequest>& req = std::nullopt);

    // 识别 Groq(OpenAI 兼容) 与 Deepgram 两种错误体，其他形态返回 nullopt
    static std::optional<ErrorInfo> parseApiErrorJson(const nlohmann::json& root, int httpStatusCode = 0);

    // ========== 重试 ==========
    // 某类错误最多重试几次（已结合 maxRetries）
    static uint32_t retryCap(ErrorType type, uint32_t maxRetries);

    // attemptCount 为已重试次数
    bool shouldRetry(const ErrorInfo& err, uint32_t attemptCount) const;

    /**
     * @brief 第 attemptCount 次重试前应等待的毫秒数
     *
     * 429 优先使用 Retry-After；5xx 固定等待；其余指数退避，可带 ±20% 抖动。
     */
    uint32_t getRetryDelayMs(
        const ErrorInfo& err,
        uint32_t attemptCount,
        const std::optional<utils::HttpResponse>& resp = std::nullopt) const;

    // ========== 日志 ==========
    // 多个会话线程并发调用时每条记录保持完整一行
    void log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err = std::nullopt) const;

    static const char* logLevelToString(LogLevel level);

    // 大小写不敏感，接受 "warn"；无法识别返回 nullopt
    static std::optional<LogLevel> parseLogLevel(const std::string& s);

    // Retry-After 的秒数或 IMF-fixdate 形式
    static std::optional<uint32_t> parseRetryAfterSeconds(const std::string& retryAfterValue);

private:
    uint32_t backoffDelayMs(uint32_t initialDelayMs, uint32_t attemptCount) const;

    RetryPolicy m_policy;
    LoggerConfig m_loggerCfg;
};

} // namespace talkback::server
