#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace talkback::server {

/**
 * @brief 将 LLM 流式文本切分为适合逐句合成的句子
 *
 * 句末标点（. ? !）之后须紧跟空白才切分，避免把 "3.5" 或缩写拆开；
 * 超过 maxChars 仍无边界时在最后一个空格处强制切分。
 */
class SentenceBuffer {
public:
    struct Options {
        size_t minChars{8};
        size_t maxChars{240};
    };

    SentenceBuffer();
    explicit SentenceBuffer(Options opt);

    // 追加文本，返回本次新完成的句子（已去除首尾空白）
    std::vector<std::string> feed(std::string_view text);

    // 取出剩余文本（流结束时调用）；无内容返回 nullopt
    std::optional<std::string> flush();

    bool empty() const { return m_buf.empty(); }

private:
    Options m_opt;
    std::string m_buf;

    bool isBoundary(size_t pos) const;
    bool isAbbreviationAt(size_t pos) const;
    std::optional<std::string> take(size_t endPos);
};

} // namespace talkback::server
