#include "talkback/server/ErrorHandler.h"
#include "talkback/server/utils/HttpTypes.h"
#include "MiniTest.h"

#include <optional>
#include <string>
#include <vector>

using namespace talkback::server;
using namespace talkback::server::utils;

static HttpResponse makeResp(int statusCode, const std::string& body = "", const std::string& err = "") {
    HttpResponse r;
    r.statusCode = statusCode;
    r.body = body;
    r.error = err;
    if (!body.empty()) {
        r.headers.add("Content-Type", "application/json");
    }
    return r;
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"status_to_error_type", []() {
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(0, "Request failed: Connection"), ErrorType::NetworkError);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(0, "Read timeout"), ErrorType::TimeoutError);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(408), ErrorType::TimeoutError);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(429), ErrorType::RateLimitError);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(401), ErrorType::InvalidRequest);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(503), ErrorType::ServerError);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(302), ErrorType::UnknownError);
    }});

    tests.push_back({"parse_groq_error_json", []() {
        const auto j = nlohmann::json::parse(R"({"error":{"message":"model not found","type":"invalid_request_error","code":"model_not_found"}})");
        auto info = ErrorHandler::parseApiErrorJson(j, 404);
        CHECK_TRUE(info.has_value());
        CHECK_EQ(info->errorCode, 404);
        CHECK_EQ(info->errorType, ErrorType::InvalidRequest);
        CHECK_EQ(info->message, std::string("model not found"));
        CHECK_TRUE(info->details.has_value());
    }});

    tests.push_back({"parse_deepgram_error_json", []() {
        const auto j = nlohmann::json::parse(R"({"err_code":"INVALID_AUTH","err_msg":"Invalid credentials.","request_id":"r1"})");
        auto info = ErrorHandler::parseApiErrorJson(j, 401);
        CHECK_TRUE(info.has_value());
        CHECK_EQ(info->errorType, ErrorType::InvalidRequest);
        CHECK_EQ(info->message, std::string("Invalid credentials."));

        CHECK_FALSE(ErrorHandler::parseApiErrorJson(nlohmann::json::parse(R"({"ok":true})"), 500).has_value());
    }});

    tests.push_back({"from_http_response_prefers_api_message", []() {
        auto resp = makeResp(429, R"({"error":{"message":"rate limited","type":"rate_limit","code":"rate_limit"}})");
        auto info = ErrorHandler::fromHttpResponse(resp);
        CHECK_EQ(info.errorType, ErrorType::RateLimitError);
        CHECK_TRUE(info.message.find("rate limited") != std::string::npos);
    }});

    tests.push_back({"from_http_response_transport_failure", []() {
        HttpRequest req;
        req.method = HttpMethod::POST;
        req.url = "https://api.groq.com/openai/v1/chat/completions";
        req.headers["Authorization"] = "Bearer secret";

        auto info = ErrorHandler::fromHttpResponse(makeResp(0, "", "Request failed: Connection"), req);
        CHECK_EQ(info.errorType, ErrorType::NetworkError);
        CHECK_EQ(info.message, std::string("Request failed: Connection"));
        CHECK_TRUE(info.context.has_value());
        CHECK_EQ(info.context->at("url"), req.url);
        CHECK_TRUE(info.toString().find("secret") == std::string::npos);
    }});

    tests.push_back({"retry_after_seconds_parse", []() {
        auto sec = ErrorHandler::parseRetryAfterSeconds(" 120 ");
        CHECK_TRUE(sec.has_value());
        CHECK_EQ(*sec, 120U);
        CHECK_FALSE(ErrorHandler::parseRetryAfterSeconds("abc").has_value());
        CHECK_FALSE(ErrorHandler::parseRetryAfterSeconds("").has_value());
    }});

    tests.push_back({"should_retry_caps", []() {
        ErrorHandler h;
        ErrorInfo e;

        e.errorType = ErrorType::InvalidRequest;
        CHECK_FALSE(h.shouldRetry(e, 0));
        e.errorType = ErrorType::ProtocolError;
        CHECK_FALSE(h.shouldRetry(e, 0));
        e.errorType = ErrorType::TransportError;
        CHECK_FALSE(h.shouldRetry(e, 0));
        e.errorType = ErrorType::UnknownError;
        CHECK_FALSE(h.shouldRetry(e, 0));

        e.errorType = ErrorType::TimeoutError;
        CHECK_TRUE(h.shouldRetry(e, 1));
        CHECK_FALSE(h.shouldRetry(e, 2));

        e.errorType = ErrorType::NetworkError;
        CHECK_TRUE(h.shouldRetry(e, 2));
        CHECK_FALSE(h.shouldRetry(e, 3));

        e.errorType = ErrorType::RateLimitError;
        CHECK_TRUE(h.shouldRetry(e, 4));
        CHECK_FALSE(h.shouldRetry(e, 5));
    }});

    tests.push_back({"policy_max_retries_lowers_caps", []() {
        auto p = ErrorHandler::RetryPolicy::makeDefault();
        p.maxRetries = 1;
        ErrorHandler h(p);
        ErrorInfo e;
        e.errorType = ErrorType::ServerError;
        CHECK_TRUE(h.shouldRetry(e, 0));
        CHECK_FALSE(h.shouldRetry(e, 1));

        p.maxRetries = 0;
        h.setRetryPolicy(p);
        e.errorType = ErrorType::NetworkError;
        CHECK_FALSE(h.shouldRetry(e, 0));
    }});

    tests.push_back({"retry_delay_uses_retry_after_header", []() {
        auto p = ErrorHandler::RetryPolicy::makeDefault();
        p.initialDelayMs = 5000;
        p.enableJitter = false;
        ErrorHandler h(p);

        ErrorInfo e;
        e.errorType = ErrorType::RateLimitError;
        HttpResponse resp = makeResp(429, R"({"error":{"message":"rate limited"}})");
        resp.headers.add("Retry-After", "2");

        CHECK_EQ(h.getRetryDelayMs(e, 3, std::optional<HttpResponse>{resp}), 2000U);
    }});

    tests.push_back({"retry_delay_backoff_without_jitter", []() {
        auto p = ErrorHandler::RetryPolicy::makeDefault();
        p.initialDelayMs = 100;
        p.maxDelayMs = 300;
        p.enableJitter = false;
        ErrorHandler h(p);

        ErrorInfo e;
        e.errorType = ErrorType::NetworkError;
        CHECK_EQ(h.getRetryDelayMs(e, 0), 100U);
        CHECK_EQ(h.getRetryDelayMs(e, 1), 200U);
        CHECK_EQ(h.getRetryDelayMs(e, 2), 300U);

        e.errorType = ErrorType::ServerError;
        CHECK_EQ(h.getRetryDelayMs(e, 2), 300U);
    }});

    tests.push_back({"log_level_parse", []() {
        CHECK_TRUE(ErrorHandler::parseLogLevel("DEBUG") == ErrorHandler::LogLevel::Debug);
        CHECK_TRUE(ErrorHandler::parseLogLevel(" warn ") == ErrorHandler::LogLevel::Warning);
        CHECK_FALSE(ErrorHandler::parseLogLevel("verbose").has_value());
        CHECK_EQ(std::string(ErrorHandler::logLevelToString(ErrorHandler::LogLevel::Info)), std::string("INFO"));
    }});

    tests.push_back({"session_error_carries_info", []() {
        auto info = ErrorInfo::make(ErrorType::TransportError, "client write failed");
        info.addContext("session_id", "s1");
        info.addContext("empty", "");
        SessionError e(info);
        CHECK_EQ(std::string(e.what()), std::string("client write failed"));
        CHECK_EQ(e.errorInfo().errorType, ErrorType::TransportError);
        CHECK_EQ(e.errorInfo().context->size(), static_cast<size_t>(1));

        const auto j = e.errorInfo().toJson();
        CHECK_EQ(j["error_type"].get<std::string>(), std::string("TransportError"));
        CHECK_EQ(j["context"]["session_id"].get<std::string>(), std::string("s1"));
        CHECK_FALSE(j.contains("details"));
    }});

    return mini_test::run(tests);
}
