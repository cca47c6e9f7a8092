#include "EventLoopTimer.hpp"
#include <limits>
#include "EventLoopManager.hpp"

CEventLoopTimer::CEventLoopTimer(std::optional<Time::steady_dur> timeout, std::function<void(SP<CEventLoopTimer> self, void* data)> cb_, void* data_) :
    m_cb(cb_), m_data(data_), m_timeout(timeout) {
    ;
}

void CEventLoopTimer::attach(WP<CEventLoopManager> loop) {
    m_loop = loop;

    if (m_timeout.has_value() && !m_expires.has_value())
        m_expires = loop->now() + *m_timeout;
}

void CEventLoopTimer::updateTimeout(std::optional<Time::steady_dur> timeout) {
    m_timeout = timeout;

    if (!timeout.has_value()) {
        m_expires.reset();
        return;
    }

    // not added yet, resolved in attach()
    if (!m_loop) {
        m_expires.reset();
        return;
    }

    m_wasCancelled = false;
    m_expires      = m_loop->now() + *timeout;
}

bool CEventLoopTimer::passed() {
    if (!m_expires.has_value() || !m_loop)
        return false;
    return m_loop->now() >= *m_expires;
}

void CEventLoopTimer::cancel() {
    m_wasCancelled = true;
    m_expires.reset();
}

bool CEventLoopTimer::cancelled() {
    return m_wasCancelled;
}

void CEventLoopTimer::call(SP<CEventLoopTimer> self) {
    m_expires.reset();
    m_cb(self, m_data);
}

float CEventLoopTimer::leftUs() {
    if (!m_expires.has_value() || !m_loop)
        return std::numeric_limits<float>::max();

    return std::chrono::duration_cast<std::chrono::microseconds>(*m_expires - m_loop->now()).count();
}

bool CEventLoopTimer::armed() {
    return m_expires.has_value();
}
