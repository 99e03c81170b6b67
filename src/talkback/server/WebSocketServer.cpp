#include "talkback/server/WebSocketServer.h"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <utility>

namespace talkback::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using LogLevel = ErrorHandler::LogLevel;

namespace {

ErrorInfo transportError(const std::string& what, const beast::error_code& ec) {
    auto info = ErrorInfo::make(ErrorType::TransportError, what + ": " + ec.message());
    info.details = nlohmann::json{{"error_category", ec.category().name()}, {"error_value", ec.value()}};
    return info;
}

/**
 * @brief 一个客户端 WebSocket 连接
 *
 * 读只在会话读线程，写由 m_writeMu 串行化；close() 直接断开底层 socket，使阻塞的读返回。
 */
class WebSocketTransport : public Transport {
public:
    explicit WebSocketTransport(tcp::socket socket)
        : m_ws(std::move(socket))
    {}

    // 读取 HTTP 请求并完成 Upgrade；路径不符或非 Upgrade 请求回复 404
    bool accept(const std::string& expectedPath, ErrorInfo* err) {
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        beast::error_code ec;
        http::read(m_ws.next_layer(), buffer, req, ec);
        if (ec) {
            if (err) *err = transportError("HTTP read failed", ec);
            return false;
        }

        std::string target(req.target());
        if (const auto q = target.find('?'); q != std::string::npos) target.resize(q);
        if (!websocket::is_upgrade(req) || target != expectedPath) {
            http::response<http::string_body> res{http::status::not_found, req.version()};
            res.set(http::field::content_type, "text/plain");
            res.body() = "not found\n";
            res.prepare_payload();
            http::write(m_ws.next_layer(), res, ec);
            if (err) *err = ErrorInfo::make(ErrorType::InvalidRequest, "rejected request for " + std::string(req.target()), 404);
            return false;
        }

        m_ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, "talkback-server");
        }));
        m_ws.accept(req, ec);
        if (ec) {
            if (err) *err = transportError("websocket accept failed", ec);
            return false;
        }
        return true;
    }

    bool readFrame(Frame& out, ErrorInfo* err) override {
        beast::flat_buffer buffer;
        beast::error_code ec;
        m_ws.read(buffer, ec);
        if (ec) {
            // 客户端正常关闭或本端 close()：不算错误
            if (err && ec != websocket::error::closed && !m_closed.load()) {
                *err = transportError("websocket read failed", ec);
            }
            return false;
        }
        out.binary = m_ws.got_binary();
        out.payload = beast::buffers_to_string(buffer.data());
        return true;
    }

    bool writeFrame(const Frame& frame, ErrorInfo* err) override {
        std::lock_guard<std::mutex> lk(m_writeMu);
        if (m_closed.load()) {
            if (err) *err = ErrorInfo::make(ErrorType::TransportError, "websocket already closed");
            return false;
        }
        beast::error_code ec;
        m_ws.binary(frame.binary);
        m_ws.write(net::buffer(frame.payload), ec);
        if (ec) {
            if (err) *err = transportError("websocket write failed", ec);
            return false;
        }
        return true;
    }

    void close() override {
        if (m_closed.exchange(true)) return;
        std::lock_guard<std::mutex> lk(m_writeMu);
        beast::error_code ignored;
        auto& socket = beast::get_lowest_layer(m_ws);
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

private:
    websocket::stream<tcp::socket> m_ws;
    std::mutex m_writeMu;
    std::atomic<bool> m_closed{false};
};

} // namespace

struct WebSocketServer::Impl {
    net::io_context ioc{1};
    tcp::acceptor acceptor{ioc};
};

struct WebSocketServer::Connection {
    std::shared_ptr<WebSocketTransport> transport;
    std::thread thread;
    std::atomic<bool> done{false};
};

WebSocketServer::Options WebSocketServer::Options::fromConfig(const ConfigManager& cfg) {
    Options o;
    o.host = cfg.getString("server.host", o.host);
    o.port = static_cast<uint16_t>(cfg.getInt("server.port", o.port));
    o.path = cfg.getString("server.path", o.path);
    return o;
}

WebSocketServer::WebSocketServer(Options options, const ErrorHandler& errorHandler, ConnectionHandler handler)
    : m_options(std::move(options))
    , m_errorHandler(errorHandler)
    , m_handler(std::move(handler))
    , m_impl(std::make_unique<Impl>())
{}

WebSocketServer::~WebSocketServer() {
    stop();
    closeAll();
}

bool WebSocketServer::run(ErrorInfo* err) {
    beast::error_code ec;
    const auto address = net::ip::make_address(m_options.host, ec);
    if (ec) {
        if (err) *err = ErrorInfo::make(ErrorType::InvalidRequest, "invalid server.host: " + m_options.host);
        return false;
    }
    const tcp::endpoint endpoint{address, m_options.port};

    auto& acceptor = m_impl->acceptor;
    acceptor.open(endpoint.protocol(), ec);
    if (!ec) acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor.bind(endpoint, ec);
    if (!ec) acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        if (err) {
            *err = transportError("failed to listen on " + m_options.host + ":" + std::to_string(m_options.port), ec);
        }
        return false;
    }

    m_boundPort.store(acceptor.local_endpoint(ec).port());
    m_errorHandler.log(LogLevel::Info,
        "listening on ws://" + m_options.host + ":" + std::to_string(m_boundPort.load()) + m_options.path);

    doAccept();
    // 只有 accept 走 io_context；连接上的读写都是同步调用
    m_impl->ioc.run();

    closeAll();
    m_errorHandler.log(LogLevel::Info, "server stopped");
    return true;
}

void WebSocketServer::doAccept() {
    m_impl->acceptor.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (m_stopping.load() || ec == net::error::operation_aborted) return;
        if (ec) {
            m_errorHandler.log(LogLevel::Warning, "accept failed", transportError("accept failed", ec));
        } else {
            startConnection(std::move(socket));
        }
        doAccept();
    });
}

void WebSocketServer::startConnection(tcp::socket socket) {
    reapFinished();

    auto conn = std::make_unique<Connection>();
    conn->transport = std::make_shared<WebSocketTransport>(std::move(socket));
    Connection* raw = conn.get();
    const std::string sessionId = nextSessionId();
    raw->thread = std::thread([this, raw, sessionId]() {
        ErrorInfo acceptErr;
        if (raw->transport->accept(m_options.path, &acceptErr)) {
            m_handler(*raw->transport, sessionId);
        } else {
            m_errorHandler.log(LogLevel::Info, "[session=" + sessionId + "] connection rejected", acceptErr);
        }
        raw->transport->close();
        raw->done.store(true);
    });

    std::lock_guard<std::mutex> lk(m_connMu);
    m_connections.push_back(std::move(conn));
}

void WebSocketServer::stop() {
    if (m_stopping.exchange(true)) return;
    net::post(m_impl->ioc, [this]() {
        beast::error_code ignored;
        m_impl->acceptor.close(ignored);
    });
    m_impl->ioc.stop();
}

size_t WebSocketServer::activeConnections() const {
    std::lock_guard<std::mutex> lk(m_connMu);
    size_t n = 0;
    for (const auto& c : m_connections) {
        if (!c->done.load()) ++n;
    }
    return n;
}

void WebSocketServer::reapFinished() {
    std::lock_guard<std::mutex> lk(m_connMu);
    for (auto it = m_connections.begin(); it != m_connections.end();) {
        if ((*it)->done.load()) {
            if ((*it)->thread.joinable()) (*it)->thread.join();
            it = m_connections.erase(it);
        } else {
            ++it;
        }
    }
}

void WebSocketServer::closeAll() {
    std::list<std::unique_ptr<Connection>> conns;
    {
        std::lock_guard<std::mutex> lk(m_connMu);
        conns.swap(m_connections);
    }
    for (auto& c : conns) {
        c->transport->close();
    }
    for (auto& c : conns) {
        if (c->thread.joinable()) c->thread.join();
    }
}

std::string WebSocketServer::nextSessionId() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::to_string(ms % 100000000) + "-" + std::to_string(++m_sessionCounter);
}

} // namespace talkback::server
