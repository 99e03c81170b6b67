#include "talkback/server/Session.h"
#include "TestFakes.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

using namespace talkback::server;
using namespace talkback::server::test;
using namespace std::chrono_literals;

namespace {

struct SessionHarness {
    FakeTransport transport;
    ErrorHandler errorHandler{makeQuietErrorHandler()};
    FakeSttProvider stt;
    FakeResponder responder;
    FakeSynthesizer synthesizer;
    TurnSettings settings;

    std::unique_ptr<Session> session;
    std::optional<ErrorInfo> result;
    std::thread runner;

    SessionHarness() {
        settings.finalizeTimeout = 2000ms;
        settings.sttRetryInitialDelayMs = 1;
    }

    ~SessionHarness() {
        stop();
    }

    void start() {
        session = std::make_unique<Session>("s1", transport, stt, responder, &synthesizer, errorHandler, settings);
        runner = std::thread([this]() { result = session->run(); });
    }

    // 客户端断开并等待会话结束
    void stop() {
        transport.finishInput();
        if (runner.joinable()) runner.join();
    }

    // 会话自行结束（致命错误）
    void join() {
        if (runner.joinable()) runner.join();
    }

    bool waitTurnComplete(uint64_t turnId) {
        return transport.waitFor([turnId](const std::vector<Frame>& frames) {
            return hasTurnComplete(frames, turnId);
        });
    }

    bool waitErrorPacket(uint64_t turnId) {
        return transport.waitFor([turnId](const std::vector<Frame>& frames) {
            for (const auto& p : decodeAll(frames)) {
                if (p.type == "error" && p.turnId == turnId) return true;
            }
            return false;
        });
    }
};

// 最后一个属于 turnId 的包的位置；二进制帧按其后第一个 turnComplete 归属
std::pair<int, int> turnSpan(const std::vector<DecodedPacket>& packets, uint64_t turnId) {
    int first = -1;
    int last = -1;
    for (int i = 0; i < static_cast<int>(packets.size()); ++i) {
        if (!packets[i].binary && packets[i].turnId == turnId) {
            if (first < 0) first = i;
            last = i;
        }
    }
    return {first, last};
}

} // namespace

TEST(SessionTests, MissingConversationIdIsRejectedAndSessionContinues) {
    SessionHarness h;
    h.start();

    h.transport.pushMessage("hello", "", "text");
    ASSERT_TRUE(h.waitErrorPacket(0));

    h.transport.pushMessage("hello", "c1", "text");
    ASSERT_TRUE(h.waitTurnComplete(1));
    h.stop();

    EXPECT_FALSE(h.result.has_value());
    auto packets = decodeAll(h.transport.written());
    ASSERT_FALSE(packets.empty());
    EXPECT_EQ(packets[0].type, "error");
    EXPECT_NE(packets[0].text.find("conversationId"), std::string::npos);

    auto calls = h.responder.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].conversationId, "c1");
}

TEST(SessionTests, MalformedMessageIsRejected) {
    SessionHarness h;
    h.start();

    h.transport.pushText("{not json");
    ASSERT_TRUE(h.waitErrorPacket(0));
    h.transport.pushText(R"({"conversationId":"c1","type":"text","text":""})");
    h.stop();

    EXPECT_FALSE(h.result.has_value());
    auto packets = decodeAll(h.transport.written());
    ASSERT_EQ(packets.size(), 2u);
    EXPECT_EQ(packets[0].type, "error");
    EXPECT_EQ(packets[1].type, "error");
    EXPECT_TRUE(h.responder.calls().empty());
}

TEST(SessionTests, NonJsonTextWithSplitUtf8IsRejectedAndSessionContinues) {
    SessionHarness h;
    // 默认级别：拒绝消息的 Warning 日志会序列化错误详情
    h.errorHandler.setLoggerConfig(ErrorHandler::LoggerConfig{});
    h.start();

    // 第 256 字节落在 "é" 的中间
    h.transport.pushText(std::string(255, 'x') + "\xC3\xA9 not json");
    ASSERT_TRUE(h.waitErrorPacket(0));

    h.transport.pushMessage("hello", "c1", "text");
    ASSERT_TRUE(h.waitTurnComplete(1));
    h.stop();

    EXPECT_FALSE(h.result.has_value());
    auto calls = h.responder.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].utterance, "hello");
}

TEST(SessionTests, VoiceTurnsAreDeliveredInOrder) {
    SessionHarness h;
    h.responder.deltas = {"Hello there. ", "How are you?"};
    h.responder.deltaDelay = 30ms;
    h.start();

    h.transport.pushAudio("first ");
    h.transport.pushAudio("turn");
    h.transport.pushMessage("", "c1", "audioEnd");
    // Turn 1 回复期间到达的输入被缓存，之后重放给 Turn 2
    h.transport.pushAudio("second");
    h.transport.pushMessage("", "c1", "audioEnd");

    ASSERT_TRUE(h.waitTurnComplete(2));
    h.stop();
    EXPECT_FALSE(h.result.has_value());

    auto calls = h.responder.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].utterance, "first turn");
    EXPECT_EQ(calls[1].utterance, "second");

    auto packets = decodeAll(h.transport.written());
    const auto t1 = turnSpan(packets, 1);
    const auto t2 = turnSpan(packets, 2);
    ASSERT_GE(t1.first, 0);
    ASSERT_GE(t2.first, 0);
    EXPECT_LT(t1.second, t2.first);
    EXPECT_EQ(packets[t1.second].type, "turnComplete");
    EXPECT_EQ(packets[t2.second].type, "turnComplete");

    // 每个 Turn 恰好一个音频帧，且位于本 Turn 的 turnComplete 之前
    int audioInTurn1 = 0;
    for (int i = 0; i < t1.second; ++i) {
        if (packets[i].binary) ++audioInTurn1;
    }
    EXPECT_EQ(audioInTurn1, 1);
    EXPECT_TRUE(packets[t1.second - 1].binary);
    EXPECT_EQ(packets[t1.second - 1].text, "<Hello there.><How are you?>");

    const auto audioTotal = std::count_if(packets.begin(), packets.end(), [](const DecodedPacket& p) { return p.binary; });
    EXPECT_EQ(audioTotal, 2);
}

TEST(SessionTests, PendingOverflowIsRejected) {
    SessionHarness h;
    h.settings.pendingFrameLimit = 2;
    h.responder.hold();
    h.start();

    h.transport.pushMessage("hello", "c1", "text");
    h.transport.pushAudio("a");
    h.transport.pushAudio("b");
    h.transport.pushAudio("c");
    ASSERT_TRUE(h.waitErrorPacket(0));

    h.responder.release();
    ASSERT_TRUE(h.waitTurnComplete(1));
    // 缓存的两帧重放给 Turn 2
    for (int i = 0; i < 200 && h.stt.received().size() < 2; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(h.stt.received(), (std::vector<std::string>{"a", "b"}));
    h.stop();

    bool sawOverflow = false;
    for (const auto& p : decodeAll(h.transport.written())) {
        if (p.type == "error" && p.text.find("input buffer full") != std::string::npos) sawOverflow = true;
    }
    EXPECT_TRUE(sawOverflow);
}

TEST(SessionTests, TransportWriteFailureEndsSession) {
    SessionHarness h;
    h.transport.failWritesFrom(0);
    h.start();

    h.transport.pushMessage("hello", "c1", "text");
    h.join();

    ASSERT_TRUE(h.result.has_value());
    EXPECT_EQ(h.result->errorType, ErrorType::TransportError);
    EXPECT_TRUE(h.transport.isClosed());
}

TEST(SessionTests, ExhaustedResponderIsFatalButReported) {
    SessionHarness h;
    h.settings.responderRetries = 0;
    h.responder.failures = 10;
    h.start();

    h.transport.pushMessage("hello", "c1", "text");
    h.join();

    ASSERT_TRUE(h.result.has_value());
    EXPECT_EQ(h.result->errorType, ErrorType::ServerError);

    auto packets = decodeAll(h.transport.written());
    ASSERT_EQ(packets.size(), 2u);
    EXPECT_EQ(packets[0].type, "error");
    EXPECT_EQ(packets[0].turnId, 1u);
    EXPECT_EQ(packets[1].type, "turnComplete");
}

TEST(SessionTests, SttFailureIsFatal) {
    SessionHarness h;
    h.stt.failOpens = 100;
    h.stt.openErrorType = ErrorType::InvalidRequest;
    h.start();

    h.transport.pushAudio("a");
    h.join();

    ASSERT_TRUE(h.result.has_value());
    EXPECT_EQ(h.result->errorType, ErrorType::InvalidRequest);
}

TEST(SessionTests, DisconnectCancelsActiveTurn) {
    SessionHarness h;
    h.responder.hold();
    h.start();

    h.transport.pushMessage("hello", "c1", "text");
    for (int i = 0; i < 200 && h.responder.calls().empty(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    h.stop();

    EXPECT_FALSE(h.result.has_value());
    EXPECT_FALSE(hasTurnComplete(h.transport.written(), 1));
    EXPECT_EQ(h.session->pendingFrames(), 0u);
}
