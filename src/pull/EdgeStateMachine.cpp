#include "EdgeStateMachine.hpp"
#include "../debug/log/Logger.hpp"

CEdgeStateMachine::CEdgeStateMachine(ePullEdge edge, float threshold, ePullStatus initial) : m_edge(edge), m_threshold(threshold), m_status(initial) {
    ;
}

ePullEdge CEdgeStateMachine::edge() const {
    return m_edge;
}

ePullStatus CEdgeStateMachine::status() const {
    return m_status;
}

float CEdgeStateMachine::threshold() const {
    return m_threshold;
}

bool CEdgeStateMachine::dropped() const {
    return m_dropped;
}

bool CEdgeStateMachine::loading() const {
    return m_status == PULL_STATUS_LOADING;
}

void CEdgeStateMachine::setStatus(ePullStatus status) {
    if (m_status == status)
        return;

    Log::logger->log(Log::TRACE, "CEdgeStateMachine ({}): {} -> {}", toString(m_edge), toString(m_status), toString(status));

    m_status = status;
    m_events.statusChange.emit(status);
}

void CEdgeStateMachine::init() {
    if (m_status == PULL_STATUS_IDLE)
        setStatus(PULL_STATUS_PULL);
}

void CEdgeStateMachine::resetForGesture() {
    if (loading())
        return;

    m_dropped = false;
    setStatus(PULL_STATUS_PULL);
}

void CEdgeStateMachine::update(float magnitude) {
    if (loading())
        return;

    setStatus(magnitude >= m_threshold ? PULL_STATUS_DROP : PULL_STATUS_PULL);
}

bool CEdgeStateMachine::release() {
    if (loading())
        return false;

    m_dropped = true;

    if (m_status == PULL_STATUS_DROP) {
        setStatus(PULL_STATUS_LOADING);
        return true;
    }

    setStatus(PULL_STATUS_PULL);
    return false;
}

void CEdgeStateMachine::abandon() {
    if (loading())
        return;

    setStatus(PULL_STATUS_PULL);
}

bool CEdgeStateMachine::beginLoading() {
    if (loading())
        return false;

    setStatus(PULL_STATUS_LOADING);
    return true;
}

void CEdgeStateMachine::finish() {
    m_dropped = false;
    setStatus(PULL_STATUS_PULL);
}
