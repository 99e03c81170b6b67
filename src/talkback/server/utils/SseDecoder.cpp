#include "talkback/server/utils/SseDecoder.h"

#include <utility>

namespace talkback::server::utils {

void SseDecoder::feed(std::string_view chunk) {
    m_partialLine.append(chunk.data(), chunk.size());

    size_t start = 0;
    for (size_t nl = m_partialLine.find('\n'); nl != std::string::npos; nl = m_partialLine.find('\n', start)) {
        std::string_view line(m_partialLine.data() + start, nl - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        onLine(line);
        start = nl + 1;
    }
    m_partialLine.erase(0, start);
}

void SseDecoder::onLine(std::string_view line) {
    if (line.empty()) {
        if (m_hasData) {
            SseEvent ev;
            ev.done = (m_data == "[DONE]");
            ev.data = std::move(m_data);
            m_ready.push_back(std::move(ev));
        }
        m_data.clear();
        m_hasData = false;
        return;
    }

    constexpr std::string_view kField = "data:";
    if (line.substr(0, kField.size()) != kField) return;
    line.remove_prefix(kField.size());
    if (!line.empty() && line.front() == ' ') line.remove_prefix(1);

    if (m_hasData) m_data.push_back('\n');
    m_data.append(line.data(), line.size());
    m_hasData = true;
}

std::vector<SseEvent> SseDecoder::drain() {
    std::vector<SseEvent> out;
    out.swap(m_ready);
    return out;
}

} // namespace talkback::server::utils
