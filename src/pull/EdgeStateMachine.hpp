#pragma once

#include "PullTypes.hpp"
#include "../helpers/signal/Signal.hpp"

/*
    pull -> drop -> loading -> pull for one edge.
    Offsets handed in are magnitudes, the caller deals with the sign.
*/
class CEdgeStateMachine {
  public:
    CEdgeStateMachine(ePullEdge edge, float threshold, ePullStatus initial);

    ePullEdge   edge() const;
    ePullStatus status() const;
    float       threshold() const;
    bool        dropped() const;
    bool        loading() const;

    // idle -> pull
    void init();

    // touch down. An edge that is loading is left alone.
    void resetForGesture();

    // claimed move
    void update(float magnitude);

    // claimed release. Returns true when the loader has to be started (drop -> loading).
    bool release();

    // claim lost or gesture cancelled, back to pull without releasing
    void abandon();

    // enter loading without a gesture. Returns false if already loading.
    bool beginLoading();

    // loader finished or failed
    void finish();

    struct {
        CSignalT<ePullStatus> statusChange;
    } m_events;

  private:
    void        setStatus(ePullStatus status);

    ePullEdge   m_edge      = PULL_EDGE_NONE;
    float       m_threshold = 0.F;
    ePullStatus m_status    = PULL_STATUS_IDLE;
    bool        m_dropped   = false;
};
