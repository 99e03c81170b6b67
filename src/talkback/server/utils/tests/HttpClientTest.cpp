#include "talkback/server/utils/HttpClient.h"
#include "talkback/server/utils/HttpSerialization.h"
#include "talkback/server/utils/HttpTypes.h"

#include <gtest/gtest.h>

using namespace talkback::server::utils;

namespace talkback::server::utils {
class HttpClientTestAccessor {
public:
    static std::map<std::string, std::string> Merge(HttpClient& c,
        const std::map<std::string, std::string>& h) {
        return c.mergeHeaders(h);
    }
};
} // namespace talkback::server::utils

TEST(HttpClientTests, RequestHeadersWinOverDefaults) {
    HttpClient client("https://example.com");
    client.setDefaultHeader("Authorization", "Bearer default");
    client.setDefaultHeader("X-Client", "talkback");

    auto merged = HttpClientTestAccessor::Merge(client, {{"Authorization", "Token request"}});
    EXPECT_EQ(merged["Authorization"], "Token request");
    EXPECT_EQ(merged["X-Client"], "talkback");
}

TEST(HttpClientTests, SplitUrl) {
    auto parts = HttpClient::splitUrl("https://api.example.com:8443/v1/speak?model=a");
    EXPECT_EQ(parts.first, "https://api.example.com:8443");
    EXPECT_EQ(parts.second, "/v1/speak?model=a");
    EXPECT_EQ(HttpClient::splitUrl("http://host").second, "/");
}

TEST(HttpClientTests, RequestBuildUrl) {
    HttpRequest req;
    req.url = "https://api.example.com/v1/speak";
    EXPECT_EQ(req.buildUrl(), req.url);

    req.setParam("model", "aura asteria");
    req.setParam("encoding", "mp3");
    EXPECT_EQ(req.buildUrl(), "https://api.example.com/v1/speak?encoding=mp3&model=aura%20asteria");

    req.url += "?x=1";
    EXPECT_EQ(req.buildUrl(), "https://api.example.com/v1/speak?x=1&encoding=mp3&model=aura%20asteria");
}

TEST(HttpClientTests, ResponseJsonAndHeaders) {
    HttpResponse resp;
    resp.statusCode = 200;
    resp.body = R"({"ok":true})";
    resp.headers.add("Content-Type", "application/json");
    resp.headers.add("Retry-After", "3");

    auto j = resp.asJson();
    ASSERT_TRUE(j.has_value());
    EXPECT_TRUE((*j)["ok"].get<bool>());
    EXPECT_EQ(resp.headers.contentType().value_or(""), "application/json");
    EXPECT_TRUE(resp.headers.has("retry-after"));

    resp.body = "{broken";
    std::string err;
    EXPECT_FALSE(resp.asJson(&err).has_value());
    EXPECT_FALSE(err.empty());
}

TEST(HttpClientTests, QuerySerialization) {
    EXPECT_EQ(encodeUrlComponent("en-US"), "en-US");
    EXPECT_EQ(encodeUrlComponent("a&b=c"), "a%26b%3Dc");
    EXPECT_EQ(serializeQuery({{"b", "2"}, {"a", "1"}}), "a=1&b=2");
}

TEST(HttpClientTests, TruncateUtf8StopsAtCharacterBoundary) {
    EXPECT_EQ(truncateUtf8("short", 16), "short");
    EXPECT_EQ(truncateUtf8("abcdef", 3), "abc");
    // "é" 占 2 字节，截断点落在中间时整字符丢弃
    EXPECT_EQ(truncateUtf8("ab\xC3\xA9", 3), "ab");
    // "中" 占 3 字节
    EXPECT_EQ(truncateUtf8("\xE4\xB8\xAD\xE4\xB8\xAD", 4), "\xE4\xB8\xAD");
    EXPECT_EQ(truncateUtf8("\xE4\xB8\xAD", 0), "");
}

TEST(HttpClientTests, StreamAgainstClosedPortFails) {
    HttpClient client("http://127.0.0.1:1");
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = "http://127.0.0.1:1/v1/speak";
    req.timeoutMs = 1000;
    bool called = false;
    req.streamHandler = [&](std::string_view) { called = true; return true; };

    auto resp = client.executeStream(req);
    EXPECT_EQ(resp.statusCode, 0);
    EXPECT_FALSE(resp.error.empty());
    EXPECT_FALSE(called);
}

TEST(HttpClientTests, StoppedClientDoesNotConnect) {
    HttpClient client("http://127.0.0.1:1");
    client.stop();

    HttpRequest req;
    req.method = HttpMethod::POST;
    auto resp = client.executeStream(req);
    EXPECT_EQ(resp.statusCode, 0);
    EXPECT_EQ(resp.error, "cancelled");
}
