#include "talkback/server/ChatResponder.h"
#include "talkback/server/ConfigManager.h"
#include "talkback/server/ConversationStore.h"
#include "talkback/server/DeepgramStt.h"
#include "talkback/server/DeepgramTts.h"
#include "talkback/server/ErrorHandler.h"
#include "talkback/server/LlmClient.h"
#include "talkback/server/Session.h"
#include "talkback/server/Turn.h"
#include "talkback/server/WebSocketServer.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <algorithm>
#include <csignal>
#include <string>
#include <thread>

using talkback::server::ChatResponder;
using talkback::server::ConfigManager;
using talkback::server::ConversationStore;
using talkback::server::DeepgramStt;
using talkback::server::DeepgramTts;
using talkback::server::ErrorHandler;
using talkback::server::ErrorInfo;
using talkback::server::LlmClient;
using talkback::server::Session;
using talkback::server::Transport;
using talkback::server::TurnSettings;
using talkback::server::WebSocketServer;

using LogLevel = ErrorHandler::LogLevel;

int main(int argc, char** argv) {
    // 配置路径：第一个参数，默认 config/talkback.json（不存在时生成模板）
    const std::string configPath = argc > 1 ? argv[1] : "config/talkback.json";

    ErrorHandler errorHandler;
    ConfigManager cfg;
    ErrorInfo err;
    if (!cfg.loadFromFile(configPath, &err)) {
        errorHandler.log(LogLevel::Error, "failed to load config " + configPath, err);
        return 1;
    }
    cfg.applyEnvironmentOverrides();

    const auto issues = cfg.validate();
    for (const auto& s : issues) {
        errorHandler.log(s.rfind("WARN:", 0) == 0 ? LogLevel::Warning : LogLevel::Error, "config: " + s);
    }
    if (ConfigManager::hasHardValidationErrors(issues)) {
        errorHandler.log(LogLevel::Error, "invalid configuration, exiting");
        return 1;
    }

    ErrorHandler::LoggerConfig loggerCfg;
    if (auto level = ErrorHandler::parseLogLevel(cfg.getString("logging.level", "info")); level.has_value()) {
        loggerCfg.minLevel = *level;
    }
    errorHandler.setLoggerConfig(loggerCfg);

    auto sttOptions = DeepgramStt::Options::fromConfig(cfg, &err);
    if (!sttOptions.has_value()) {
        errorHandler.log(LogLevel::Error, "invalid STT configuration", err);
        return 1;
    }
    DeepgramStt stt(*sttOptions, errorHandler);

    LlmClient llm(cfg);
    ConversationStore history(static_cast<size_t>(std::max<long long>(1, cfg.getInt("history.max_messages", 20))));
    ChatResponder responder(llm, history);
    DeepgramTts tts(cfg);
    const auto settings = TurnSettings::fromConfig(cfg);

    errorHandler.log(LogLevel::Info,
        "LLM " + llm.getBaseUrl() + " model=" + llm.getModel() + " key=" + llm.getApiKeyRedacted());

    WebSocketServer server(WebSocketServer::Options::fromConfig(cfg), errorHandler,
        [&](Transport& transport, const std::string& sessionId) {
            Session session(sessionId, transport, stt, responder, &tts, errorHandler, settings);
            if (auto fatal = session.run(); fatal.has_value()) {
                errorHandler.log(LogLevel::Debug, "[session=" + sessionId + "] ended after fatal error");
            }
        });

    // SIGINT/SIGTERM：停止 accept 并关闭所有连接
    boost::asio::io_context signalIoc;
    boost::asio::signal_set signals(signalIoc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        errorHandler.log(LogLevel::Info, "received signal " + std::to_string(signo) + ", shutting down");
        server.stop();
    });
    std::thread signalThread([&]() { signalIoc.run(); });

    const bool ok = server.run(&err);
    if (!ok) {
        errorHandler.log(LogLevel::Error, "server failed to start", err);
    }

    signalIoc.stop();
    signalThread.join();
    return ok ? 0 : 1;
}
