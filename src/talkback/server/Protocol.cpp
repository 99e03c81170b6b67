#include "talkback/server/Protocol.h"

#include "talkback/server/utils/HttpSerialization.h"

#include "nlohmann/json.hpp"

namespace talkback::server {

static bool readStringField(const nlohmann::json& j, const char* key, std::string& out, ErrorInfo* err) {
    if (!j.contains(key) || j[key].is_null()) {
        out.clear();
        return true;
    }
    if (!j[key].is_string()) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::ProtocolError, std::string("field '") + key + "' must be a string");
        }
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

std::optional<InboundMessage> parseInboundMessage(const std::string& text, ErrorInfo* err) {
    std::string parseErr;
    auto parsed = utils::parseJsonSafe(text, &parseErr);
    if (!parsed.has_value()) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::ProtocolError, "invalid JSON message");
            err->details = nlohmann::json{{"parse_error", parseErr}, {"snippet", utils::truncateUtf8(text, 256)}};
        }
        return std::nullopt;
    }
    if (!parsed->is_object()) {
        if (err) *err = ErrorInfo::make(ErrorType::ProtocolError, "message must be a JSON object");
        return std::nullopt;
    }

    InboundMessage msg;
    if (!readStringField(*parsed, "text", msg.text, err)) return std::nullopt;
    if (!readStringField(*parsed, "conversationId", msg.conversationId, err)) return std::nullopt;
    if (!readStringField(*parsed, "type", msg.type, err)) return std::nullopt;
    return msg;
}

const char* packetKindToString(PacketKind kind) {
    switch (kind) {
        case PacketKind::Transcript: return "transcript";
        case PacketKind::BotText: return "botText";
        case PacketKind::BotAudio: return "botAudio";
        case PacketKind::TurnComplete: return "turnComplete";
        default: return "error";
    }
}

OutboundPacket OutboundPacket::makeText(PacketKind kind, uint64_t turnId, std::string text) {
    OutboundPacket p;
    p.kind = kind;
    p.turnId = turnId;
    p.text = std::move(text);
    return p;
}

OutboundPacket OutboundPacket::makeAudio(uint64_t turnId, std::vector<uint8_t> audio) {
    OutboundPacket p;
    p.kind = PacketKind::BotAudio;
    p.turnId = turnId;
    p.audio = std::move(audio);
    return p;
}

Frame encodePacket(const OutboundPacket& packet) {
    if (packet.kind == PacketKind::BotAudio) {
        return Frame::bytes(std::string(packet.audio.begin(), packet.audio.end()));
    }
    nlohmann::json j;
    j["type"] = packetKindToString(packet.kind);
    j["turnId"] = packet.turnId;
    j["text"] = packet.text;
    // 来自 LLM/STT 的文本可能截断在 UTF-8 字符中间
    return Frame::text(j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace talkback::server
