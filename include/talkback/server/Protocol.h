#pragma once

#include "talkback/server/ErrorTypes.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace talkback::server {

/**
 * @brief 客户端连接上的一帧（二进制 = 音频，文本 = JSON 消息）
 */
struct Frame {
    bool binary{false};
    std::string payload;

    static Frame text(std::string s) { return Frame{false, std::move(s)}; }
    static Frame bytes(std::string s) { return Frame{true, std::move(s)}; }
};

/**
 * @brief 入站控制/文本消息：{"text", "conversationId", "type"}
 */
struct InboundMessage {
    std::string text;
    std::string conversationId;
    std::string type;

    bool isAudioEnd() const { return type == "audioEnd"; }
};

// 解析失败（非 JSON、非 object、字段类型不符）返回 nullopt，并写入 ProtocolError
std::optional<InboundMessage> parseInboundMessage(const std::string& text, ErrorInfo* err = nullptr);

enum class PacketKind {
    Transcript,    // 用户语音识别片段
    BotText,       // LLM 回复增量
    BotAudio,      // 整个 Turn 的合成语音
    TurnComplete,  // Turn 结束标记
    Error          // 可恢复错误通知
};

const char* packetKindToString(PacketKind kind);

/**
 * @brief 发往客户端的一个数据单元
 */
struct OutboundPacket {
    PacketKind kind{PacketKind::BotText};
    uint64_t turnId{0};
    std::string text;
    std::vector<uint8_t> audio;

    static OutboundPacket makeText(PacketKind kind, uint64_t turnId, std::string text);
    static OutboundPacket makeAudio(uint64_t turnId, std::vector<uint8_t> audio);

    // 估算的线上字节数，用于统计
    size_t payloadSize() const { return kind == PacketKind::BotAudio ? audio.size() : text.size(); }
};

/**
 * @brief 编码为线上帧
 *
 * BotAudio 为二进制帧，其余为 JSON 文本帧 {"type","turnId","text"}。
 */
Frame encodePacket(const OutboundPacket& packet);

} // namespace talkback::server
