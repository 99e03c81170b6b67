#include "talkback/server/TurnController.h"

#include <stdexcept>

namespace talkback::server {

using LogLevel = ErrorHandler::LogLevel;

TurnController::TurnController(TurnContext ctx, TurnDoneCallback onTurnDone)
    : m_ctx(std::move(ctx))
    , m_onTurnDone(std::move(onTurnDone))
{
    wireNextTurn();
}

TurnController::~TurnController() {
    shutdown();
}

TurnState TurnController::state() const {
    return m_turn ? m_turn->state() : TurnState::Closed;
}

uint64_t TurnController::currentTurnId() const {
    return m_turn ? m_turn->id() : 0;
}

bool TurnController::isBusy() const {
    return !m_turn || m_turn->state() != TurnState::Listening;
}

Turn& TurnController::current() {
    if (!m_turn) {
        throw std::logic_error("TurnController used after shutdown");
    }
    return *m_turn;
}

void TurnController::onAudio(const std::string& audio) {
    current().sendAudio(audio);
}

TranscriptAggregator::Result TurnController::endOfInput(const std::string& conversationId) {
    auto& turn = current();
    auto result = turn.finalize();
    if (result.text.empty()) {
        turn.closeEmpty();
    } else {
        turn.respond(result.text, conversationId);
    }
    return result;
}

void TurnController::submitText(const std::string& text, const std::string& conversationId) {
    auto& turn = current();
    turn.beginDirectText();
    turn.respond(text, conversationId);
}

bool TurnController::onTurnClosed(uint64_t turnId) {
    if (!m_turn || m_turn->id() != turnId) {
        m_ctx.errorHandler.log(LogLevel::Debug,
            "[session=" + m_ctx.sessionId + "] ignoring close of stale turn " + std::to_string(turnId));
        return false;
    }
    if (m_turn->state() != TurnState::Closed) {
        throw std::logic_error("TurnController::onTurnClosed before turn reached Closed");
    }
    m_turn->join();
    m_turn.reset();
    wireNextTurn();
    return true;
}

void TurnController::shutdown() {
    if (!m_turn) return;
    m_turn->cancel();
    m_turn->join();
    m_turn.reset();
}

void TurnController::wireNextTurn() {
    const uint64_t id = m_nextTurnId++;
    m_turn = std::make_unique<Turn>(id, m_ctx, m_onTurnDone);
    m_ctx.errorHandler.log(LogLevel::Debug,
        "[session=" + m_ctx.sessionId + " turn=" + std::to_string(id) + "] listening");
}

} // namespace talkback::server
