#include "talkback/server/DeepgramStt.h"

#include "talkback/server/utils/HttpSerialization.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace talkback::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

using LogLevel = ErrorHandler::LogLevel;

namespace {

constexpr const char* kFinalizeMessage = R"({"type":"Finalize"})";
constexpr const char* kCloseStreamMessage = R"({"type":"CloseStream"})";
// CloseStream 之后等待服务端结束的时间
constexpr auto kGracefulCloseTimeout = std::chrono::milliseconds(2000);

using WsStream = websocket::stream<beast::ssl_stream<tcp::socket>>;

ErrorInfo networkError(const std::string& what, const beast::error_code& ec) {
    auto info = ErrorInfo::make(ErrorType::NetworkError, what + ": " + ec.message());
    info.details = nlohmann::json{{"error_category", ec.category().name()}, {"error_value", ec.value()}};
    return info;
}

class DeepgramStream : public SttStream {
public:
    DeepgramStream(std::unique_ptr<net::io_context> ioc,
                   std::unique_ptr<ssl::context> sslCtx,
                   std::unique_ptr<WsStream> ws,
                   SttEventSink sink,
                   bool continuesUtterance,
                   const ErrorHandler& errorHandler)
        : m_ioc(std::move(ioc))
        , m_sslCtx(std::move(sslCtx))
        , m_ws(std::move(ws))
        , m_sink(std::move(sink))
        , m_errorHandler(errorHandler)
        , m_parser(continuesUtterance)
    {
        m_reader = std::thread([this]() { readLoop(); });
    }

    ~DeepgramStream() override {
        close();
    }

    bool send(const std::string& audio, ErrorInfo* err) override {
        if (m_closing.load()) {
            if (err) *err = ErrorInfo::make(ErrorType::NetworkError, "STT stream already closed");
            return false;
        }
        beast::error_code ec;
        {
            std::lock_guard<std::mutex> lk(m_writeMu);
            m_ws->binary(true);
            m_ws->write(net::buffer(audio), ec);
        }
        if (ec) {
            if (err) *err = networkError("STT write failed", ec);
            return false;
        }
        m_audioSinceFlush.store(true);
        return true;
    }

    bool flush(ErrorInfo* err) override {
        if (m_closing.load()) {
            if (err) *err = ErrorInfo::make(ErrorType::NetworkError, "STT stream already closed");
            return false;
        }
        // 自上次 flush 以来没有音频：服务端不会回应，直接确认
        if (!m_audioSinceFlush.exchange(false)) {
            emit(SttEvent::flushed());
            return true;
        }
        beast::error_code ec;
        {
            std::lock_guard<std::mutex> lk(m_writeMu);
            m_ws->text(true);
            m_ws->write(net::buffer(std::string(kFinalizeMessage)), ec);
        }
        if (ec) {
            if (err) *err = networkError("STT finalize failed", ec);
            return false;
        }
        return true;
    }

    void close() override {
        bool expected = false;
        if (m_closing.compare_exchange_strong(expected, true)) {
            beast::error_code ec;
            {
                std::lock_guard<std::mutex> lk(m_writeMu);
                m_ws->text(true);
                m_ws->write(net::buffer(std::string(kCloseStreamMessage)), ec);
            }

            std::unique_lock<std::mutex> lk(m_doneMu);
            const bool graceful = !ec && m_doneCv.wait_for(lk, kGracefulCloseTimeout, [this] { return m_readerDone; });
            lk.unlock();
            if (!graceful) {
                // 服务端未及时结束：直接断开底层 socket，读线程随即退出
                std::lock_guard<std::mutex> wlk(m_writeMu);
                beast::error_code ignored;
                beast::get_lowest_layer(*m_ws).shutdown(tcp::socket::shutdown_both, ignored);
                beast::get_lowest_layer(*m_ws).close(ignored);
            }
        }
        if (m_reader.joinable() && m_reader.get_id() != std::this_thread::get_id()) {
            m_reader.join();
        }
    }

private:
    void readLoop() {
        for (;;) {
            beast::flat_buffer buffer;
            beast::error_code ec;
            m_ws->read(buffer, ec);
            if (ec) {
                if (!m_closing.load() && ec != websocket::error::closed) {
                    emit(SttEvent::failure(networkError("STT read failed", ec)));
                } else {
                    m_errorHandler.log(LogLevel::Debug, "STT stream ended: " + ec.message());
                }
                break;
            }
            if (!m_ws->got_text()) continue;
            for (auto& ev : m_parser.parse(beast::buffers_to_string(buffer.data()))) {
                emit(std::move(ev));
            }
        }
        {
            std::lock_guard<std::mutex> lk(m_doneMu);
            m_readerDone = true;
        }
        m_doneCv.notify_all();
        emit(SttEvent::closed());
    }

    // Closed 之后不再产出任何事件
    void emit(SttEvent ev) {
        std::lock_guard<std::mutex> lk(m_emitMu);
        if (m_closedEmitted) return;
        if (ev.kind == SttEvent::Kind::Closed) m_closedEmitted = true;
        if (m_sink) m_sink(std::move(ev));
    }

    std::unique_ptr<net::io_context> m_ioc;
    std::unique_ptr<ssl::context> m_sslCtx;
    std::unique_ptr<WsStream> m_ws;
    SttEventSink m_sink;
    const ErrorHandler& m_errorHandler;
    DeepgramResultParser m_parser;

    std::mutex m_writeMu;
    std::atomic<bool> m_closing{false};
    std::atomic<bool> m_audioSinceFlush{false};

    std::mutex m_doneMu;
    std::condition_variable m_doneCv;
    bool m_readerDone{false};

    std::mutex m_emitMu;
    bool m_closedEmitted{false};

    std::thread m_reader;
};

} // namespace

// ========== DeepgramResultParser ==========

std::vector<SttEvent> DeepgramResultParser::parse(const std::string& message) {
    std::vector<SttEvent> out;
    const auto j = nlohmann::json::parse(message, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        out.push_back(SttEvent::failure(ErrorInfo::make(ErrorType::UnknownError, "unparsable STT message")));
        return out;
    }

    if (j.contains("err_msg") && j["err_msg"].is_string()) {
        auto info = ErrorInfo::make(ErrorType::ServerError, j["err_msg"].get<std::string>());
        info.details = j;
        out.push_back(SttEvent::failure(std::move(info)));
        return out;
    }

    const std::string type = j.value("type", std::string{});
    if (type == "Error") {
        auto info = ErrorInfo::make(ErrorType::ServerError, j.value("description", std::string{"STT error"}));
        info.details = j;
        out.push_back(SttEvent::failure(std::move(info)));
        return out;
    }
    if (type != "Results") return out;

    std::string transcript;
    if (j.contains("channel") && j["channel"].is_object()) {
        const auto& alts = j["channel"].value("alternatives", nlohmann::json::array());
        if (alts.is_array() && !alts.empty() && alts[0].is_object()) {
            const auto& t = alts[0].value("transcript", nlohmann::json{});
            if (t.is_string()) transcript = t.get<std::string>();
        }
    }

    const bool isFinal = j.value("is_final", false);
    const bool fromFinalize = j.value("from_finalize", false);

    if (isFinal && !transcript.empty()) {
        out.push_back(SttEvent::fragment(m_hasFragment ? " " + transcript : transcript));
        m_hasFragment = true;
    }
    if (fromFinalize) {
        out.push_back(SttEvent::flushed());
    }
    return out;
}

// ========== DeepgramStt ==========

std::optional<DeepgramStt::Options> DeepgramStt::Options::fromConfig(const ConfigManager& cfg, ErrorInfo* err) {
    Options o;
    const std::string url = cfg.getString("stt.base_url", "wss://api.deepgram.com/v1/listen");
    const std::string scheme = "wss://";
    if (url.rfind(scheme, 0) != 0) {
        if (err) *err = ErrorInfo::make(ErrorType::InvalidRequest, "stt.base_url must start with wss://: " + url);
        return std::nullopt;
    }

    const std::string rest = url.substr(scheme.size());
    const auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    o.path = (slash == std::string::npos) ? "/" : rest.substr(slash);
    if (const auto colon = authority.find(':'); colon != std::string::npos) {
        o.port = authority.substr(colon + 1);
        authority.resize(colon);
    }
    if (authority.empty()) {
        if (err) *err = ErrorInfo::make(ErrorType::InvalidRequest, "stt.base_url has no host: " + url);
        return std::nullopt;
    }
    o.host = authority;

    o.apiKey = cfg.getString("stt.api_key", "");
    o.model = cfg.getString("stt.model", o.model);
    o.language = cfg.getString("stt.language", o.language);
    o.encoding = cfg.getString("stt.encoding", o.encoding);
    o.sampleRate = static_cast<int>(cfg.getInt("stt.sample_rate", o.sampleRate));
    o.channels = static_cast<int>(cfg.getInt("stt.channels", o.channels));
    return o;
}

std::string DeepgramStt::Options::target() const {
    const std::map<std::string, std::string> params{
        {"model", model},
        {"language", language},
        {"encoding", encoding},
        {"sample_rate", std::to_string(sampleRate)},
        {"channels", std::to_string(channels)},
        {"punctuate", "true"},
        {"interim_results", "false"},
    };
    return path + "?" + utils::serializeQuery(params);
}

DeepgramStt::DeepgramStt(Options options, const ErrorHandler& errorHandler)
    : m_options(std::move(options))
    , m_errorHandler(errorHandler)
{}

std::unique_ptr<SttStream> DeepgramStt::open(SttEventSink sink, bool continuesUtterance, ErrorInfo* err) {
    auto ioc = std::make_unique<net::io_context>();
    auto sslCtx = std::make_unique<ssl::context>(ssl::context::tlsv12_client);
    sslCtx->set_default_verify_paths();
    sslCtx->set_verify_mode(ssl::verify_peer);
    auto ws = std::make_unique<WsStream>(*ioc, *sslCtx);

    const auto& host = m_options.host;
    beast::error_code ec;

    tcp::resolver resolver(*ioc);
    const auto results = resolver.resolve(host, m_options.port, ec);
    if (ec) {
        if (err) *err = networkError("STT resolve failed for " + host, ec);
        return nullptr;
    }
    net::connect(beast::get_lowest_layer(*ws), results, ec);
    if (ec) {
        if (err) *err = networkError("STT connect failed for " + host, ec);
        return nullptr;
    }

    // SNI
    if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), host.c_str())) {
        if (err) *err = ErrorInfo::make(ErrorType::NetworkError, "failed to set SNI hostname " + host);
        return nullptr;
    }
    ws->next_layer().set_verify_callback(ssl::host_name_verification(host));
    ws->next_layer().handshake(ssl::stream_base::client, ec);
    if (ec) {
        if (err) *err = networkError("STT TLS handshake failed", ec);
        return nullptr;
    }

    const std::string authorization = "Token " + m_options.apiKey;
    ws->set_option(websocket::stream_base::decorator([authorization](websocket::request_type& req) {
        req.set(http::field::authorization, authorization);
        req.set(http::field::user_agent, "talkback-server");
    }));

    websocket::response_type res;
    ws->handshake(res, host, m_options.target(), ec);
    if (ec) {
        const int status = static_cast<int>(res.result_int());
        if (err) {
            if (status >= 400) {
                *err = ErrorInfo::make(ErrorHandler::mapHttpStatusToErrorType(status),
                                       "STT handshake rejected: HTTP " + std::to_string(status), status);
                if (!res.body().empty()) {
                    auto body = nlohmann::json::parse(res.body(), nullptr, false);
                    if (!body.is_discarded()) {
                        if (auto api = ErrorHandler::parseApiErrorJson(body, status); api.has_value()) *err = *api;
                    }
                }
            } else {
                *err = networkError("STT websocket handshake failed", ec);
            }
            err->addContext("host", host);
            err->addContext("model", m_options.model);
        }
        return nullptr;
    }

    m_errorHandler.log(LogLevel::Debug, "STT stream connected to " + host + " (model " + m_options.model + ")");
    return std::make_unique<DeepgramStream>(std::move(ioc), std::move(sslCtx), std::move(ws), std::move(sink),
                                            continuesUtterance, m_errorHandler);
}

} // namespace talkback::server
