#include "talkback/server/ErrorHandler.h"
#include "talkback/server/utils/HttpSerialization.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <limits>
#include <mutex>
#include <random>
#include <sstream>

namespace talkback::server {

namespace {

std::string lowerTrimmed(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    std::string out;
    out.reserve(e - b);
    for (size_t i = b; i < e; ++i) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[i]))));
    }
    return out;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string stringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

// {"err_code": "...", "err_msg": "..."}
std::optional<ErrorInfo> parseDeepgramError(const nlohmann::json& root, int status) {
    const auto msg = stringField(root, "err_msg");
    if (msg.empty()) return std::nullopt;
    auto info = ErrorInfo::make(ErrorHandler::mapHttpStatusToErrorType(status), msg, status);
    info.details = root;
    return info;
}

// {"error": {"message": "...", "type": "...", "code": "..."}}
std::optional<ErrorInfo> parseOpenAiError(const nlohmann::json& root, int status) {
    auto it = root.find("error");
    if (it == root.end() || !it->is_object()) return std::nullopt;
    const auto& e = *it;

    auto msg = stringField(e, "message");
    auto info = ErrorInfo::make(ErrorHandler::mapHttpStatusToErrorType(status),
                                msg.empty() ? "API error" : msg, status);
    info.details = e;

    const auto type = lowerTrimmed(stringField(e, "type"));
    const auto code = lowerTrimmed(stringField(e, "code"));
    if (contains(type, "rate") || contains(code, "rate")) info.errorType = ErrorType::RateLimitError;
    if (contains(type, "timeout")) info.errorType = ErrorType::TimeoutError;
    return info;
}

std::mutex& logMutex() {
    static std::mutex mu;
    return mu;
}

int levelRank(ErrorHandler::LogLevel lv) {
    return static_cast<int>(lv);
}

} // namespace

const char* ErrorHandler::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: break;
    }
    return "DEBUG";
}

std::optional<ErrorHandler::LogLevel> ErrorHandler::parseLogLevel(const std::string& s) {
    const auto v = lowerTrimmed(s);
    if (v == "error") return LogLevel::Error;
    if (v == "warning" || v == "warn") return LogLevel::Warning;
    if (v == "info") return LogLevel::Info;
    if (v == "debug") return LogLevel::Debug;
    return std::nullopt;
}

ErrorType ErrorHandler::mapHttpStatusToErrorType(int statusCode, const std::string& transportError) {
    if (statusCode == 0) {
        return contains(lowerTrimmed(transportError), "timeout") ? ErrorType::TimeoutError : ErrorType::NetworkError;
    }
    if (statusCode == 408) return ErrorType::TimeoutError;
    if (statusCode == 429) return ErrorType::RateLimitError;
    if (statusCode >= 500 && statusCode < 600) return ErrorType::ServerError;
    if (statusCode >= 400 && statusCode < 500) return ErrorType::InvalidRequest;
    return ErrorType::UnknownError;
}

std::optional<ErrorInfo> ErrorHandler::parseApiErrorJson(const nlohmann::json& root, int httpStatusCode) {
    if (!root.is_object()) return std::nullopt;
    if (auto dg = parseDeepgramError(root, httpStatusCode)) return dg;
    return parseOpenAiError(root, httpStatusCode);
}

ErrorInfo ErrorHandler::fromHttpResponse(const utils::HttpResponse& resp, const std::optional<utils::HttpRequest>& req) {
    std::optional<nlohmann::json> body;
    if (resp.isJson()) body = resp.asJson();

    std::optional<ErrorInfo> api;
    if (body) api = parseApiErrorJson(*body, resp.statusCode);

    ErrorInfo info = api.value_or(ErrorInfo::make(mapHttpStatusToErrorType(resp.statusCode, resp.error), "", resp.statusCode));
    if (info.message.empty()) {
        if (!resp.error.empty()) info.message = resp.error;
        else if (!resp.body.empty()) info.message = utils::truncateUtf8(resp.body, 256);
        else info.message = "HTTP request failed";
    }

    if (!info.details) {
        nlohmann::json d{{"http_status", resp.statusCode}};
        if (!resp.error.empty()) d["transport_error"] = resp.error;
        if (body) d["body_json"] = *body;
        else if (!resp.body.empty()) d["body_snippet"] = utils::truncateUtf8(resp.body, 1024);
        info.details = std::move(d);
    }

    if (req) {
        info.addContext("url", req->url);
        info.addContext("method", utils::methodName(req->method));
    }
    return info;
}

uint32_t ErrorHandler::retryCap(ErrorType type, uint32_t maxRetries) {
    switch (type) {
        case ErrorType::NetworkError: return std::min<uint32_t>(maxRetries, 3);
        case ErrorType::TimeoutError: return std::min<uint32_t>(maxRetries, 2);
        case ErrorType::ServerError: return std::min<uint32_t>(maxRetries, 2);
        // 限流通常很快恢复，至少允许 5 次
        case ErrorType::RateLimitError: return std::max<uint32_t>(maxRetries, 5);
        case ErrorType::InvalidRequest:
        case ErrorType::ProtocolError:
        case ErrorType::TransportError:
        case ErrorType::UnknownError:
            break;
    }
    return 0;
}

bool ErrorHandler::shouldRetry(const ErrorInfo& err, uint32_t attemptCount) const {
    return attemptCount < retryCap(err.errorType, m_policy.maxRetries);
}

uint32_t ErrorHandler::backoffDelayMs(uint32_t initialDelayMs, uint32_t attemptCount) const {
    double delay = static_cast<double>(initialDelayMs) *
                   std::pow(m_policy.backoffMultiplier, static_cast<double>(attemptCount));
    delay = std::min(delay, static_cast<double>(m_policy.maxDelayMs));

    if (m_policy.enableJitter) {
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> factor(-0.2, 0.2);
        delay += delay * factor(rng);
    }
    return static_cast<uint32_t>(std::max(0.0, delay));
}

std::optional<uint32_t> ErrorHandler::parseRetryAfterSeconds(const std::string& retryAfterValue) {
    const auto v = lowerTrimmed(retryAfterValue);
    if (v.empty()) return std::nullopt;

    if (std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        if (v.size() > 9) return std::numeric_limits<uint32_t>::max() / 1000U;
        return static_cast<uint32_t>(std::stoul(v));
    }

    // "Sun, 06 Nov 1994 08:49:37 GMT"
    std::tm tm{};
    std::istringstream iss(retryAfterValue);
    iss.imbue(std::locale::classic());
    iss >> std::ws >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    if (iss.fail()) return std::nullopt;

    const auto when = timegm(&tm);
    if (when <= 0) return std::nullopt;
    const auto delta = when - std::time(nullptr);
    return static_cast<uint32_t>(std::max<std::time_t>(0, delta));
}

uint32_t ErrorHandler::getRetryDelayMs(
    const ErrorInfo& err,
    uint32_t attemptCount,
    const std::optional<utils::HttpResponse>& resp) const {

    switch (err.errorType) {
        case ErrorType::RateLimitError: {
            if (resp) {
                if (auto ra = resp->getHeader("Retry-After")) {
                    if (auto sec = parseRetryAfterSeconds(*ra)) {
                        const uint64_t ms = static_cast<uint64_t>(*sec) * 1000ULL;
                        return static_cast<uint32_t>(std::min<uint64_t>(ms, std::numeric_limits<uint32_t>::max()));
                    }
                }
            }
            return backoffDelayMs(std::max<uint32_t>(m_policy.initialDelayMs, 2000U), attemptCount);
        }
        case ErrorType::ServerError:
            return std::min<uint32_t>(1000U, m_policy.maxDelayMs);
        default:
            return backoffDelayMs(m_policy.initialDelayMs, attemptCount);
    }
}

void ErrorHandler::log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err) const {
    if (!m_loggerCfg.enabled || levelRank(level) > levelRank(m_loggerCfg.minLevel)) return;

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream line;
    line << '[' << ms << "] " << logLevelToString(level) << ' ' << message;
    if (err) line << ' ' << err->toString();
    line << '\n';

    const auto text = line.str();
    std::lock_guard<std::mutex> lk(logMutex());
    std::fwrite(text.data(), 1, text.size(), stderr);
    std::fflush(stderr);
}

} // namespace talkback::server
