#include "talkback/server/TranscriptAggregator.h"

#include <stdexcept>

namespace talkback::server {

bool TranscriptAggregator::onFragment(const std::string& text) {
    std::lock_guard<std::mutex> lk(m_mu);
    if (m_finalized) return false;
    m_buffer += text;
    ++m_fragments;
    return true;
}

void TranscriptAggregator::rearm(uint32_t generation) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_generation = generation;
    m_barrierResolved = false;
}

void TranscriptAggregator::onFlushed() {
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_barrierResolved = true;
    }
    m_cv.notify_all();
}

void TranscriptAggregator::onFlushed(uint32_t generation) {
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (generation != m_generation) return;
        m_barrierResolved = true;
    }
    m_cv.notify_all();
}

void TranscriptAggregator::onStreamClosed() {
    onFlushed();
}

void TranscriptAggregator::onStreamClosed(uint32_t generation) {
    onFlushed(generation);
}

TranscriptAggregator::Result TranscriptAggregator::finalize(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_mu);
    if (m_finalized) {
        throw std::logic_error("TranscriptAggregator::finalize called twice");
    }
    const bool resolved = m_cv.wait_for(lk, timeout, [this]() { return m_barrierResolved; });
    m_finalized = true;

    Result r;
    r.text = std::move(m_buffer);
    r.complete = resolved;
    m_buffer.clear();
    return r;
}

bool TranscriptAggregator::isFinalized() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_finalized;
}

size_t TranscriptAggregator::fragmentCount() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_fragments;
}

} // namespace talkback::server
