#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace talkback::server::utils {

struct SseEvent {
    std::string data;  // 多个 data 行以 '\n' 连接
    bool done{false};  // OpenAI 流结束标记 [DONE]
};

/**
 * @brief text/event-stream 增量解码
 *
 * 按行处理（\n 或 \r\n），空行结束一个事件。只关心 data 字段，
 * 注释行和 event/id/retry 字段被跳过；没有 data 行的事件不产出。
 */
class SseDecoder {
public:
    void feed(std::string_view chunk);

    // 取走已完成的事件
    std::vector<SseEvent> drain();

    // 尚未组成完整事件的字节数
    size_t buffered() const { return m_partialLine.size() + m_data.size(); }

private:
    void onLine(std::string_view line);

    std::string m_partialLine;
    std::string m_data;
    bool m_hasData{false};
    std::vector<SseEvent> m_ready;
};

} // namespace talkback::server::utils
