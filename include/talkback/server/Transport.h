#pragma once

#include "talkback/server/ErrorTypes.h"
#include "talkback/server/Protocol.h"

namespace talkback::server {

/**
 * @brief 客户端连接抽象
 *
 * readFrame 只由会话的读线程调用，writeFrame 只由 OutboundSink 的写线程调用；
 * close 可从任意线程调用，并使阻塞中的 readFrame 返回 false。
 */
class Transport {
public:
    virtual ~Transport() = default;

    // 阻塞读取下一帧；连接关闭或出错返回 false
    virtual bool readFrame(Frame& out, ErrorInfo* err = nullptr) = 0;

    virtual bool writeFrame(const Frame& frame, ErrorInfo* err = nullptr) = 0;

    virtual void close() = 0;
};

} // namespace talkback::server
