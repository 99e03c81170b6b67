#include "talkback/server/SentenceBuffer.h"

#include <algorithm>
#include <cctype>

namespace talkback::server {

namespace {

const char* const kAbbreviations[] = {
    "mr", "mrs", "ms", "dr", "prof", "sr", "jr", "st",
    "vs", "etc", "inc", "ltd", "co", "e.g", "i.e", "a.m", "p.m",
};

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trimCopy(std::string s) {
    auto notSpace = [](int ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

} // namespace

SentenceBuffer::SentenceBuffer()
    : SentenceBuffer(Options{})
{}

SentenceBuffer::SentenceBuffer(Options opt)
    : m_opt(opt)
{}

std::vector<std::string> SentenceBuffer::feed(std::string_view text) {
    std::vector<std::string> out;
    if (text.empty()) return out;
    m_buf.append(text.data(), text.size());

    for (;;) {
        size_t cut = std::string::npos;
        for (size_t i = 0; i < m_buf.size(); ++i) {
            if (isBoundary(i)) {
                cut = i + 1;
                break;
            }
        }
        if (cut == std::string::npos && m_buf.size() >= m_opt.maxChars) {
            cut = m_buf.rfind(' ', m_opt.maxChars);
            if (cut == std::string::npos || cut < m_opt.minChars) cut = m_opt.maxChars;
        }
        if (cut == std::string::npos) break;

        if (auto s = take(cut); s.has_value()) out.push_back(std::move(*s));
    }
    return out;
}

std::optional<std::string> SentenceBuffer::flush() {
    return take(m_buf.size());
}

bool SentenceBuffer::isBoundary(size_t pos) const {
    const char c = m_buf[pos];
    if (c == '\n') {
        return pos >= m_opt.minChars;
    }
    if (c != '.' && c != '?' && c != '!') return false;
    if (pos < m_opt.minChars) return false;
    // 需要看到下一个字符才能确认
    if (pos + 1 >= m_buf.size()) return false;
    const char next = m_buf[pos + 1];
    if (!isSpace(next) && next != '"' && next != '\'' && next != ')') return false;
    if (c == '.' && isAbbreviationAt(pos)) return false;
    return true;
}

bool SentenceBuffer::isAbbreviationAt(size_t pos) const {
    size_t start = pos;
    while (start > 0 && (std::isalpha(static_cast<unsigned char>(m_buf[start - 1])) || m_buf[start - 1] == '.')) {
        --start;
    }
    if (start == pos) return false;
    std::string word = m_buf.substr(start, pos - start);
    std::transform(word.begin(), word.end(), word.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    // 单字母（姓名缩写）
    if (word.size() == 1) return true;
    return std::find(std::begin(kAbbreviations), std::end(kAbbreviations), word) != std::end(kAbbreviations);
}

std::optional<std::string> SentenceBuffer::take(size_t endPos) {
    endPos = std::min(endPos, m_buf.size());
    std::string sentence = trimCopy(m_buf.substr(0, endPos));
    m_buf.erase(0, endPos);
    if (sentence.empty()) return std::nullopt;
    return sentence;
}

} // namespace talkback::server
