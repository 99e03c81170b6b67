#include "talkback/server/Relays.h"

namespace talkback::server {

TextRelay::TextRelay(OutboundSink& sink, PacketKind kind, uint64_t turnId)
    : m_sink(sink)
    , m_kind(kind)
    , m_turnId(turnId)
{}

bool TextRelay::offer(const std::string& text) {
    if (text.empty()) return false;
    // 持锁提交，保证 close() 返回后不会再有本中继的包入队
    std::lock_guard<std::mutex> lk(m_mu);
    if (m_closed) return false;
    if (!m_sink.submit(OutboundPacket::makeText(m_kind, m_turnId, text))) return false;
    ++m_forwarded;
    return true;
}

void TextRelay::close() {
    std::lock_guard<std::mutex> lk(m_mu);
    m_closed = true;
}

bool TextRelay::isClosed() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_closed;
}

size_t TextRelay::forwarded() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_forwarded;
}

AudioRelay::AudioRelay(OutboundSink& sink, uint64_t turnId)
    : m_sink(sink)
    , m_turnId(turnId)
{}

bool AudioRelay::offer(const std::vector<uint8_t>& chunk) {
    if (chunk.empty()) return false;
    std::lock_guard<std::mutex> lk(m_mu);
    if (m_closed) return false;
    m_buffer.insert(m_buffer.end(), chunk.begin(), chunk.end());
    return true;
}

bool AudioRelay::close() {
    std::lock_guard<std::mutex> lk(m_mu);
    if (m_closed) return false;
    m_closed = true;
    if (m_buffer.empty()) return false;
    auto audio = std::move(m_buffer);
    m_buffer.clear();
    return m_sink.submit(OutboundPacket::makeAudio(m_turnId, std::move(audio)));
}

void AudioRelay::discard() {
    std::lock_guard<std::mutex> lk(m_mu);
    m_closed = true;
    m_buffer.clear();
}

bool AudioRelay::isClosed() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_closed;
}

size_t AudioRelay::bufferedBytes() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_buffer.size();
}

} // namespace talkback::server
