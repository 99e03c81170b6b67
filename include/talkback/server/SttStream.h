#pragma once

#include "talkback/server/ErrorTypes.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace talkback::server {

/**
 * @brief STT 流异步产出的事件
 */
struct SttEvent {
    enum class Kind {
        Fragment,  // 一段已确定的转写文本
        Flushed,   // flush() 之前送入的音频已全部转写完毕
        Closed,    // 流已结束（每个流恰好一次，且为最后一个事件）
        Error      // 流内错误；随后仍会有 Closed
    };

    Kind kind{Kind::Fragment};
    std::string text;
    std::optional<ErrorInfo> error;
    // 由 Turn 填写，用于区分重连前后的流
    uint32_t generation{0};

    static SttEvent fragment(std::string t) {
        SttEvent ev;
        ev.kind = Kind::Fragment;
        ev.text = std::move(t);
        return ev;
    }
    static SttEvent flushed() {
        SttEvent ev;
        ev.kind = Kind::Flushed;
        return ev;
    }
    static SttEvent closed() {
        SttEvent ev;
        ev.kind = Kind::Closed;
        return ev;
    }
    static SttEvent failure(ErrorInfo info) {
        SttEvent ev;
        ev.kind = Kind::Error;
        ev.error = std::move(info);
        return ev;
    }
};

using SttEventSink = std::function<void(SttEvent)>;

/**
 * @brief 一条已打开的 STT 流
 */
class SttStream {
public:
    virtual ~SttStream() = default;

    // 发送一段音频；写失败返回 false
    virtual bool send(const std::string& audio, ErrorInfo* err = nullptr) = 0;

    // 请求服务端转写已缓冲的音频，完成后产出 Flushed
    virtual bool flush(ErrorInfo* err = nullptr) = 0;

    // 关闭流并等待其内部读线程退出；可重复调用
    virtual void close() = 0;
};

/**
 * @brief STT 流工厂
 */
class SttProvider {
public:
    virtual ~SttProvider() = default;

    /**
     * @brief 打开一条新流；失败返回 nullptr 并写入 err
     * @param continuesUtterance 本 Turn 已有转写文本（重连时），新流的首个片段也要带分隔空白
     */
    virtual std::unique_ptr<SttStream> open(SttEventSink sink, bool continuesUtterance, ErrorInfo* err = nullptr) = 0;
};

} // namespace talkback::server
