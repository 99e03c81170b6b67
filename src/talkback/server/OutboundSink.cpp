#include "talkback/server/OutboundSink.h"

namespace talkback::server {

OutboundSink::OutboundSink(Transport& transport, const ErrorHandler& errorHandler, FailureCallback onFailure)
    : m_transport(transport)
    , m_errorHandler(errorHandler)
    , m_onFailure(std::move(onFailure))
{
    m_writer = std::thread([this]() { writerLoop(); });
}

OutboundSink::~OutboundSink() {
    close();
}

bool OutboundSink::submit(OutboundPacket packet) {
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_closed) {
            ++m_stats.packetsRejected;
            return false;
        }
        m_queue.push_back(std::move(packet));
    }
    m_cv.notify_one();
    return true;
}

bool OutboundSink::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_mu);
    m_idleCv.wait_for(lk, timeout, [this]() {
        return m_failed || (m_queue.empty() && !m_writing);
    });
    return !m_failed && m_queue.empty() && !m_writing;
}

void OutboundSink::close() {
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_closed = true;
    }
    m_cv.notify_all();
    if (m_writer.joinable() && m_writer.get_id() != std::this_thread::get_id()) {
        m_writer.join();
    }
}

bool OutboundSink::isClosed() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_closed;
}

bool OutboundSink::hasFailed() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_failed;
}

OutboundSink::Stats OutboundSink::stats() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_stats;
}

void OutboundSink::writerLoop() {
    for (;;) {
        OutboundPacket packet;
        {
            std::unique_lock<std::mutex> lk(m_mu);
            m_cv.wait(lk, [this]() { return m_closed || !m_queue.empty(); });
            if (m_queue.empty()) {
                // closed 且已写完
                m_idleCv.notify_all();
                return;
            }
            packet = std::move(m_queue.front());
            m_queue.pop_front();
            m_writing = true;
        }

        const auto frame = encodePacket(packet);
        ErrorInfo err;
        const bool ok = m_transport.writeFrame(frame, &err);

        bool failedNow = false;
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_writing = false;
            if (ok) {
                ++m_stats.packetsWritten;
                m_stats.bytesWritten += frame.payload.size();
            } else {
                m_failed = true;
                m_closed = true;
                m_stats.packetsRejected += m_queue.size() + 1;
                m_queue.clear();
                failedNow = true;
            }
        }
        m_idleCv.notify_all();

        if (failedNow) {
            if (err.message.empty()) {
                err = ErrorInfo::make(ErrorType::TransportError, "client write failed");
            }
            err.errorType = ErrorType::TransportError;
            err.addContext("packet", packetKindToString(packet.kind));
            err.addContext("turn_id", std::to_string(packet.turnId));
            m_errorHandler.log(ErrorHandler::LogLevel::Error, "outbound sink closed after write failure", err);
            if (m_onFailure) m_onFailure(err);
            return;
        }
    }
}

} // namespace talkback::server
