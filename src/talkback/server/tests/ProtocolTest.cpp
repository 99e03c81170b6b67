#include "talkback/server/Protocol.h"

#include <gtest/gtest.h>

#include "nlohmann/json.hpp"

using namespace talkback::server;

TEST(ProtocolTests, ParsesInboundMessage) {
    ErrorInfo err;
    auto msg = parseInboundMessage(R"({"text":"hi","conversationId":"c1","type":"text"})", &err);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->text, "hi");
    EXPECT_EQ(msg->conversationId, "c1");
    EXPECT_EQ(msg->type, "text");
    EXPECT_FALSE(msg->isAudioEnd());
}

TEST(ProtocolTests, MissingAndNullFieldsBecomeEmpty) {
    auto msg = parseInboundMessage(R"({"conversationId":"c1","type":"audioEnd","text":null})");
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(msg->text.empty());
    EXPECT_TRUE(msg->isAudioEnd());
}

TEST(ProtocolTests, RejectsMalformedInput) {
    ErrorInfo err;
    EXPECT_FALSE(parseInboundMessage("not json", &err).has_value());
    EXPECT_EQ(err.errorType, ErrorType::ProtocolError);

    err = ErrorInfo{};
    EXPECT_FALSE(parseInboundMessage("[1,2]", &err).has_value());
    EXPECT_EQ(err.errorType, ErrorType::ProtocolError);

    err = ErrorInfo{};
    EXPECT_FALSE(parseInboundMessage(R"({"text":5,"conversationId":"c"})", &err).has_value());
    EXPECT_EQ(err.errorType, ErrorType::ProtocolError);
    EXPECT_NE(err.message.find("text"), std::string::npos);
}

TEST(ProtocolTests, RejectionSnippetKeepsUtf8Intact) {
    ErrorInfo err;
    const std::string text = std::string(255, 'x') + "\xC3\xA9 not json";
    EXPECT_FALSE(parseInboundMessage(text, &err).has_value());
    ASSERT_TRUE(err.details.has_value());
    EXPECT_EQ((*err.details)["snippet"].get<std::string>(), std::string(255, 'x'));
    EXPECT_NO_THROW((void)err.toString());

    // 原始字节本身非法时 toString 也不抛异常
    ErrorInfo raw = ErrorInfo::make(ErrorType::ServerError, "upstream failed", 502);
    raw.details = nlohmann::json{{"body_snippet", std::string("ok\xFF\xFE")}};
    std::string line;
    EXPECT_NO_THROW(line = raw.toString());
    EXPECT_NE(line.find("upstream failed"), std::string::npos);
}

TEST(ProtocolTests, EncodesTextPackets) {
    auto frame = encodePacket(OutboundPacket::makeText(PacketKind::BotText, 7, "hello"));
    EXPECT_FALSE(frame.binary);
    auto j = nlohmann::json::parse(frame.payload);
    EXPECT_EQ(j["type"], "botText");
    EXPECT_EQ(j["turnId"], 7);
    EXPECT_EQ(j["text"], "hello");

    auto done = nlohmann::json::parse(encodePacket(OutboundPacket::makeText(PacketKind::TurnComplete, 7, "")).payload);
    EXPECT_EQ(done["type"], "turnComplete");
}

TEST(ProtocolTests, EncodesAudioAsBinaryFrame) {
    auto frame = encodePacket(OutboundPacket::makeAudio(3, {0x01, 0x02, 0xff}));
    EXPECT_TRUE(frame.binary);
    ASSERT_EQ(frame.payload.size(), 3u);
    EXPECT_EQ(static_cast<uint8_t>(frame.payload[2]), 0xff);
}

TEST(ProtocolTests, InvalidUtf8IsReplaced) {
    // 截断的多字节字符
    std::string text = "ok \xe4\xbd";
    auto frame = encodePacket(OutboundPacket::makeText(PacketKind::Transcript, 1, text));
    auto j = nlohmann::json::parse(frame.payload);
    EXPECT_EQ(j["type"], "transcript");
    EXPECT_EQ(j["text"].get<std::string>().rfind("ok ", 0), 0u);
}

TEST(ProtocolTests, PacketKindNames) {
    EXPECT_STREQ(packetKindToString(PacketKind::Transcript), "transcript");
    EXPECT_STREQ(packetKindToString(PacketKind::BotAudio), "botAudio");
    EXPECT_STREQ(packetKindToString(PacketKind::Error), "error");
}
