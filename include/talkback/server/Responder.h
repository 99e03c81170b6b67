#pragma once

#include "talkback/server/ErrorTypes.h"
#include "talkback/server/utils/CancelToken.h"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace talkback::server {

using TextCallback = std::function<void(std::string_view)>;

/**
 * @brief 回复生成（LLM 调用）
 */
class Responder {
public:
    virtual ~Responder() = default;

    /**
     * @brief 为一段用户话语生成回复，阻塞直到回复流结束
     *
     * 每个文本增量调用一次 onText。取消后应尽快返回 false。
     */
    virtual bool streamReply(const std::string& utterance,
                             const std::string& conversationId,
                             const utils::CancelToken& cancel,
                             const TextCallback& onText,
                             ErrorInfo* err = nullptr) = 0;
};

/**
 * @brief 文本转语音
 */
class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    // 合成一句话；音频字节追加到 out
    virtual bool synthesize(const std::string& text,
                            const utils::CancelToken& cancel,
                            std::vector<uint8_t>& out,
                            ErrorInfo* err = nullptr) = 0;
};

} // namespace talkback::server
