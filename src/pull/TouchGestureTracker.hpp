#pragma once

#include <cstdint>

#include "PullTypes.hpp"
#include "../helpers/math/Direction.hpp"

/*
    One touch session at a time: turns finger travel into a scaled drag distance and
    decides which edge, if any, gets to consume it.
*/
class CTouchGestureTracker {
  public:
    CTouchGestureTracker(float distanceIndex, float maxDistance);

    struct SSession {
        int32_t          touchID           = 0;
        double           startY            = 0;
        double           startScrollOffset = 0;
        double           currentY          = 0;
        Math::eDirection direction         = Math::DIRECTION_NONE;
        bool             bottomReached     = false;
        ePullEdge        claimedBy         = PULL_EDGE_NONE;
    };

    // what claiming needs to know about everything outside the session
    struct SClaimInputs {
        bool        reloadConfigured   = false;
        bool        infiniteConfigured = false;
        double      scrollOffset       = 0;
        ePullStatus topStatus          = PULL_STATUS_PULL;
        ePullStatus bottomStatus       = PULL_STATUS_PULL;
        bool        bottomAllLoaded    = false;
    };

    // replaces any session still open
    void             begin(int32_t touchID, double y, double scrollOffset);
    void             move(double y);
    void             end();

    bool             active() const;
    bool             ownsTouch(int32_t touchID) const;
    const SSession&  session() const;

    // (currentY - startY) / distanceIndex
    float            distance() const;
    // distance() saturated at +-maxDistance, when set
    float            clampedDistance() const;
    Math::eDirection direction() const;

    // once seen, stays true until the next begin()
    bool             latchBottomReached(bool reachedNow);

    ePullEdge        claimFor(const SClaimInputs& in) const;
    void             setClaimed(ePullEdge edge);
    ePullEdge        claimed() const;

    // never negative
    float            topOffset() const;
    // never positive
    float            bottomOffset(double scrollOffsetNow) const;

  private:
    float    m_distanceIndex = 1.F;
    float    m_maxDistance   = 0.F;

    SSession m_session;
    bool     m_active = false;
};
