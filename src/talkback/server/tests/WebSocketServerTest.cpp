#include "talkback/server/WebSocketServer.h"
#include "TestFakes.h"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace talkback::server;
using namespace talkback::server::test;

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// 回显服务：收到什么帧就原样写回
class EchoServer {
public:
    EchoServer()
        : m_errorHandler(makeQuietErrorHandler())
    {
        WebSocketServer::Options options;
        options.host = "127.0.0.1";
        options.port = 0;
        options.path = "/ws";
        m_server = std::make_unique<WebSocketServer>(options, m_errorHandler,
            [](Transport& transport, const std::string&) {
                Frame frame;
                while (transport.readFrame(frame)) {
                    if (!transport.writeFrame(frame)) break;
                }
            });
        m_thread = std::thread([this]() { m_runOk = m_server->run(&m_runErr); });
    }

    ~EchoServer() {
        m_server->stop();
        if (m_thread.joinable()) m_thread.join();
    }

    // 等待监听就绪，返回端口；超时返回 0
    uint16_t waitPort() {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            if (auto port = m_server->boundPort()) return port;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return 0;
    }

private:
    ErrorHandler m_errorHandler;
    std::unique_ptr<WebSocketServer> m_server;
    std::thread m_thread;
    bool m_runOk{false};
    ErrorInfo m_runErr;
};

} // namespace

TEST(WebSocketServerTests, EchoesTextAndBinaryFrames) {
    EchoServer server;
    const uint16_t port = server.waitPort();
    ASSERT_NE(port, 0);

    net::io_context ioc;
    websocket::stream<tcp::socket> ws(ioc);
    ws.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    ws.handshake("127.0.0.1", "/ws");

    ws.text(true);
    ws.write(net::buffer(std::string(R"({"type":"text","text":"hi"})")));
    beast::flat_buffer buffer;
    ws.read(buffer);
    EXPECT_TRUE(ws.got_text());
    EXPECT_EQ(beast::buffers_to_string(buffer.data()), R"({"type":"text","text":"hi"})");

    buffer.consume(buffer.size());
    ws.binary(true);
    ws.write(net::buffer(std::string("\x01\x02\x03", 3)));
    ws.read(buffer);
    EXPECT_TRUE(ws.got_binary());
    EXPECT_EQ(beast::buffers_to_string(buffer.data()).size(), 3u);

    beast::error_code ec;
    ws.close(websocket::close_code::normal, ec);
}

TEST(WebSocketServerTests, RejectsOtherPaths) {
    EchoServer server;
    const uint16_t port = server.waitPort();
    ASSERT_NE(port, 0);

    net::io_context ioc;
    websocket::stream<tcp::socket> ws(ioc);
    ws.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));

    websocket::response_type res;
    beast::error_code ec;
    ws.handshake(res, "127.0.0.1", "/other", ec);
    EXPECT_TRUE(ec);
    EXPECT_EQ(res.result_int(), 404u);
}

TEST(WebSocketServerTests, InvalidHostFailsToRun) {
    ErrorHandler errorHandler = makeQuietErrorHandler();
    WebSocketServer::Options options;
    options.host = "not-an-address";
    options.port = 0;
    WebSocketServer server(options, errorHandler, [](Transport&, const std::string&) {});

    ErrorInfo err;
    EXPECT_FALSE(server.run(&err));
    EXPECT_EQ(err.errorType, ErrorType::InvalidRequest);
    EXPECT_EQ(server.boundPort(), 0);
}
