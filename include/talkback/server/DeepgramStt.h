#pragma once

#include "talkback/server/ConfigManager.h"
#include "talkback/server/ErrorHandler.h"
#include "talkback/server/SttStream.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace talkback::server {

/**
 * @brief Deepgram 实时转写消息解析
 *
 * - Results 且 is_final：一段确定文本（第二段起前置空格，便于直接拼接；
 *   continuesUtterance 时第一段也前置空格）
 * - from_finalize：Finalize 之前的音频已处理完毕
 * - err_msg / type=Error：流内错误
 * 其余消息（Metadata、SpeechStarted、UtteranceEnd）忽略。
 */
class DeepgramResultParser {
public:
    explicit DeepgramResultParser(bool continuesUtterance = false)
        : m_hasFragment(continuesUtterance)
    {}

    std::vector<SttEvent> parse(const std::string& message);

private:
    bool m_hasFragment{false};
};

/**
 * @brief Deepgram 实时 STT（Boost.Beast WebSocket over OpenSSL）
 *
 * 每次 open() 建立一条新连接；流内有一个读线程，负责解析结果并调用事件回调。
 */
class DeepgramStt : public SttProvider {
public:
    struct Options {
        std::string host{"api.deepgram.com"};
        std::string port{"443"};
        std::string path{"/v1/listen"};
        std::string apiKey;
        std::string model{"nova-2"};
        std::string language{"en-US"};
        std::string encoding{"linear16"};
        int sampleRate{16000};
        int channels{1};

        // 从 stt.* 读取；base_url 必须为 wss://host[:port]/path
        static std::optional<Options> fromConfig(const ConfigManager& cfg, ErrorInfo* err = nullptr);

        // 握手目标：path?channels=..&encoding=..&...
        std::string target() const;
    };

    DeepgramStt(Options options, const ErrorHandler& errorHandler);

    std::unique_ptr<SttStream> open(SttEventSink sink, bool continuesUtterance, ErrorInfo* err = nullptr) override;

    const Options& options() const { return m_options; }

private:
    Options m_options;
    const ErrorHandler& m_errorHandler;
};

} // namespace talkback::server
