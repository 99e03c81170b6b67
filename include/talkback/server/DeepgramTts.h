#pragma once

#include "talkback/server/ConfigManager.h"
#include "talkback/server/Responder.h"

#include <string>

namespace talkback::server {

/**
 * @brief Deepgram Aura 文本转语音（POST /v1/speak）
 *
 * 每句一次请求，响应正文即音频（默认 mp3），按块追加到输出缓冲。
 */
class DeepgramTts : public SpeechSynthesizer {
public:
    explicit DeepgramTts(const ConfigManager& cfg);

    bool synthesize(const std::string& text,
                    const utils::CancelToken& cancel,
                    std::vector<uint8_t>& out,
                    ErrorInfo* err = nullptr) override;

    // 完整请求 URL（含 model / encoding 参数）
    std::string requestUrl() const;

private:
    std::string m_baseUrl;
    std::string m_apiKey;
    std::string m_model;
    std::string m_encoding;
    int m_timeoutMs{30000};
};

} // namespace talkback::server
