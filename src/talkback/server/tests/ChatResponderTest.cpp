#include "talkback/server/ChatResponder.h"
#include "talkback/server/ConversationStore.h"
#include "talkback/server/LlmClient.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace talkback::server;
using namespace talkback::server::types;

namespace {

void loadConfig(ConfigManager& cfg, const std::string& json) {
    ErrorInfo err;
    ASSERT_TRUE(cfg.loadFromString(json, &err)) << err.message;
}

} // namespace

TEST(ConversationStoreTests, KeepsMostRecentMessages) {
    ConversationStore store(4);
    store.appendExchange("c1", "q1", "a1");
    store.appendExchange("c1", "q2", "a2");
    store.appendExchange("c1", "q3", "a3");

    auto h = store.history("c1");
    ASSERT_EQ(h.size(), 4u);
    EXPECT_EQ(h[0].content, "q2");
    EXPECT_EQ(h[0].role, MessageRole::User);
    EXPECT_EQ(h[3].content, "a3");
    EXPECT_EQ(h[3].role, MessageRole::Assistant);
}

TEST(ConversationStoreTests, ConversationsAreIsolated) {
    ConversationStore store;
    store.appendExchange("c1", "hello", "hi");
    store.addMessage("c2", ChatMessage(MessageRole::User, "other"));

    EXPECT_EQ(store.conversationCount(), 2u);
    EXPECT_EQ(store.history("c1").size(), 2u);
    EXPECT_EQ(store.history("c2").size(), 1u);
    EXPECT_TRUE(store.history("missing").empty());

    store.clear("c1");
    EXPECT_TRUE(store.history("c1").empty());
    EXPECT_EQ(store.conversationCount(), 1u);
}

TEST(LlmClientTests, ReadsConfiguration) {
    ConfigManager cfg;
    loadConfig(cfg, R"({
        "llm": {
            "base_url": "https://llm.example.com/v1",
            "api_key": "sk-test-0123456789",
            "model": "test-model",
            "system_prompt": "Be brief.",
            "temperature": 0.5,
            "max_tokens": 128,
            "timeout_ms": 1500
        }
    })");
    LlmClient client(cfg);

    EXPECT_EQ(client.getBaseUrl(), "https://llm.example.com/v1");
    EXPECT_EQ(client.getModel(), "test-model");
    EXPECT_EQ(client.getSystemPrompt(), "Be brief.");
    EXPECT_EQ(client.getDefaultTimeoutMs(), 1500);
    EXPECT_EQ(client.getApiKeyRedacted().find("0123456789"), std::string::npos);

    auto req = client.makeRequest({ChatMessage(MessageRole::User, "hi")});
    auto j = req.toJson();
    EXPECT_EQ(j["model"], "test-model");
    EXPECT_EQ(j["stream"], true);
    EXPECT_EQ(j["max_tokens"], 128);
    EXPECT_FLOAT_EQ(j["temperature"].get<float>(), 0.5f);
    ASSERT_EQ(j["messages"].size(), 1u);
    EXPECT_EQ(j["messages"][0]["role"], "user");
}

TEST(LlmClientTests, OptionalParametersAreOmitted) {
    ConfigManager cfg;
    loadConfig(cfg, R"({"llm": {"model": "m", "max_tokens": 0, "temperature": "hot"}})");
    LlmClient client(cfg);

    auto j = client.makeRequest({}).toJson();
    EXPECT_FALSE(j.contains("max_tokens"));
    EXPECT_FALSE(j.contains("temperature"));
    EXPECT_EQ(client.getDefaultTimeoutMs(), 30000);
}

TEST(ChatStreamAggregatorTests, CollectsDeltas) {
    std::vector<std::string> deltas;
    int completions = 0;
    LlmClient::Callbacks cb;
    cb.onTextDelta = [&](std::string_view d) { deltas.emplace_back(d); };
    cb.onComplete = [&](const ChatResponse&) { ++completions; };

    ChatStreamAggregator agg(cb);
    agg.onChunkJson(nlohmann::json::parse(R"({"model":"m1","choices":[{"delta":{"role":"assistant"}}]})"));
    agg.onChunkJson(nlohmann::json::parse(R"({"choices":[{"delta":{"content":"Hel"}}]})"));
    agg.onChunkJson(nlohmann::json::parse(R"({"choices":[{"delta":{"content":"lo"},"finish_reason":"stop"}]})"));
    agg.onChunkJson(nlohmann::json::parse(R"({"choices":[]})"));
    agg.onDone();
    agg.onDone();

    EXPECT_EQ(deltas, (std::vector<std::string>{"Hel", "lo"}));
    EXPECT_EQ(completions, 1);
    EXPECT_TRUE(agg.completed());

    auto r = agg.result();
    EXPECT_EQ(r.content, "Hello");
    EXPECT_EQ(r.finishReason.value_or(""), "stop");
    EXPECT_EQ(r.model.value_or(""), "m1");
}

TEST(ChatResponderTests, BuildsMessagesFromPromptAndHistory) {
    ConfigManager cfg;
    loadConfig(cfg, R"({"llm": {"system_prompt": "You are a voice assistant."}})");
    LlmClient client(cfg);
    ConversationStore store;
    store.appendExchange("c1", "earlier question", "earlier answer");
    ChatResponder responder(client, store);

    auto messages = responder.buildMessages("new question", "c1");
    ASSERT_EQ(messages.size(), 4u);
    EXPECT_EQ(messages[0].role, MessageRole::System);
    EXPECT_EQ(messages[1].content, "earlier question");
    EXPECT_EQ(messages[2].role, MessageRole::Assistant);
    EXPECT_EQ(messages[3].content, "new question");

    auto fresh = responder.buildMessages("hi", "c2");
    ASSERT_EQ(fresh.size(), 2u);
    EXPECT_EQ(fresh[1].role, MessageRole::User);
}

TEST(ChatResponderTests, ConnectionFailureIsReportedAndNotRecorded) {
    // 端口 1 上无服务，连接立即被拒绝
    ConfigManager cfg;
    loadConfig(cfg, R"({"llm": {"base_url": "http://127.0.0.1:1/v1", "timeout_ms": 2000}})");
    LlmClient client(cfg);
    ConversationStore store;
    ChatResponder responder(client, store);

    utils::CancelToken cancel;
    std::string text;
    ErrorInfo err;
    const bool ok = responder.streamReply("hello", "c1", cancel,
        [&](std::string_view d) { text.append(d.data(), d.size()); }, &err);

    EXPECT_FALSE(ok);
    EXPECT_TRUE(text.empty());
    EXPECT_FALSE(err.message.empty());
    ASSERT_TRUE(err.context.has_value());
    EXPECT_EQ(err.context->at("conversation_id"), "c1");
    EXPECT_TRUE(store.history("c1").empty());
}
