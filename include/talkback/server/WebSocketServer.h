#pragma once

#include "talkback/server/ConfigManager.h"
#include "talkback/server/ErrorHandler.h"
#include "talkback/server/Transport.h"

#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace talkback::server {

/**
 * @brief 客户端 WebSocket 服务（Boost.Beast，同步 I/O）
 *
 * 只接受 path 匹配的 Upgrade 请求，其余请求回复 404。每个连接一个线程，
 * 在该线程上调用 ConnectionHandler，返回即关闭连接。
 */
class WebSocketServer {
public:
    struct Options {
        std::string host{"0.0.0.0"};
        uint16_t port{8080};
        std::string path{"/ws"};

        static Options fromConfig(const ConfigManager& cfg);
    };

    using ConnectionHandler = std::function<void(Transport& transport, const std::string& sessionId)>;

    WebSocketServer(Options options, const ErrorHandler& errorHandler, ConnectionHandler handler);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /**
     * @brief 绑定并阻塞运行 accept 循环，直到 stop()
     * @return 绑定失败返回 false
     */
    bool run(ErrorInfo* err = nullptr);

    // 停止接受新连接，关闭现有连接并等待其线程结束；可从其他线程调用
    void stop();

    size_t activeConnections() const;

    // 实际监听端口（port 配置为 0 时由系统分配）；尚未监听时为 0
    uint16_t boundPort() const { return m_boundPort.load(); }

private:
    struct Impl;
    struct Connection;

    void doAccept();
    void startConnection(boost::asio::ip::tcp::socket socket);
    void reapFinished();
    void closeAll();
    std::string nextSessionId();

    Options m_options;
    const ErrorHandler& m_errorHandler;
    ConnectionHandler m_handler;

    std::unique_ptr<Impl> m_impl;
    std::atomic<bool> m_stopping{false};
    std::atomic<uint64_t> m_sessionCounter{0};
    std::atomic<uint16_t> m_boundPort{0};

    mutable std::mutex m_connMu;
    std::list<std::unique_ptr<Connection>> m_connections;
};

} // namespace talkback::server
