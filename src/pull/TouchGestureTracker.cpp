#include "TouchGestureTracker.hpp"
#include "../debug/log/Logger.hpp"

#include <algorithm>

#include <hyprutils/memory/Casts.hpp>
using namespace Hyprutils::Memory;

CTouchGestureTracker::CTouchGestureTracker(float distanceIndex, float maxDistance) : m_distanceIndex(distanceIndex), m_maxDistance(maxDistance) {
    ;
}

void CTouchGestureTracker::begin(int32_t touchID, double y, double scrollOffset) {
    if (m_active)
        Log::logger->log(Log::TRACE, "CTouchGestureTracker::begin: touch {} replaces the open session of touch {}", touchID, m_session.touchID);

    m_session = SSession{
        .touchID           = touchID,
        .startY            = y,
        .startScrollOffset = scrollOffset,
        .currentY          = y,
    };
    m_active = true;
}

void CTouchGestureTracker::move(double y) {
    if (!m_active)
        return;

    m_session.currentY  = y;
    m_session.direction = Math::fromDelta(distance());
}

void CTouchGestureTracker::end() {
    m_session.direction = Math::DIRECTION_NONE;
    m_session.claimedBy = PULL_EDGE_NONE;
    m_active            = false;
}

bool CTouchGestureTracker::active() const {
    return m_active;
}

bool CTouchGestureTracker::ownsTouch(int32_t touchID) const {
    return m_active && m_session.touchID == touchID;
}

const CTouchGestureTracker::SSession& CTouchGestureTracker::session() const {
    return m_session;
}

float CTouchGestureTracker::distance() const {
    return (m_session.currentY - m_session.startY) / m_distanceIndex;
}

float CTouchGestureTracker::clampedDistance() const {
    const auto D = distance();

    if (m_maxDistance <= 0.F)
        return D;

    return std::clamp(D, -m_maxDistance, m_maxDistance);
}

Math::eDirection CTouchGestureTracker::direction() const {
    return m_session.direction;
}

bool CTouchGestureTracker::latchBottomReached(bool reachedNow) {
    m_session.bottomReached = m_session.bottomReached || reachedNow;
    return m_session.bottomReached;
}

ePullEdge CTouchGestureTracker::claimFor(const SClaimInputs& in) const {
    if (!m_active)
        return PULL_EDGE_NONE;

    if (m_session.direction == Math::DIRECTION_DOWN) {
        // scroll offset has to be exactly at the top
        if (in.reloadConfigured && in.scrollOffset == 0 && in.topStatus != PULL_STATUS_LOADING)
            return PULL_EDGE_TOP;
        return PULL_EDGE_NONE;
    }

    if (m_session.direction == Math::DIRECTION_UP) {
        if (in.infiniteConfigured && m_session.bottomReached && in.bottomStatus != PULL_STATUS_LOADING && !in.bottomAllLoaded)
            return PULL_EDGE_BOTTOM;
        return PULL_EDGE_NONE;
    }

    return PULL_EDGE_NONE;
}

void CTouchGestureTracker::setClaimed(ePullEdge edge) {
    if (m_session.claimedBy != edge)
        Log::logger->log(Log::TRACE, "CTouchGestureTracker: touch {} claimed by {} (was {})", m_session.touchID, toString(edge), toString(m_session.claimedBy));

    m_session.claimedBy = edge;
}

ePullEdge CTouchGestureTracker::claimed() const {
    return m_session.claimedBy;
}

float CTouchGestureTracker::topOffset() const {
    return std::max(0.F, clampedDistance() - sc<float>(m_session.startScrollOffset));
}

float CTouchGestureTracker::bottomOffset(double scrollOffsetNow) const {
    return std::min(0.F, sc<float>(scrollOffsetNow - m_session.startScrollOffset) + clampedDistance());
}
