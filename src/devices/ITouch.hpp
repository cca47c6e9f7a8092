#pragma once

#include <cstdint>
#include <string>

#include "../helpers/math/Math.hpp"
#include "../helpers/memory/Memory.hpp"
#include "../helpers/signal/Signal.hpp"

/*
    Base class for a touch source. Positions are in viewport coordinates.
*/
class ITouch {
  public:
    virtual ~ITouch() = default;

    virtual std::string deviceName() = 0;

    struct SDownEvent {
        uint32_t timeMs  = 0;
        int32_t  touchID = 0;
        Vector2D pos;
    };

    struct SUpEvent {
        uint32_t timeMs  = 0;
        int32_t  touchID = 0;
    };

    struct SMotionEvent {
        uint32_t timeMs  = 0;
        int32_t  touchID = 0;
        Vector2D pos;
    };

    struct SCancelEvent {
        uint32_t timeMs  = 0;
        int32_t  touchID = 0;
    };

    struct {
        CSignalT<SDownEvent>   down;
        CSignalT<SUpEvent>     up;
        CSignalT<SMotionEvent> motion;
        CSignalT<SCancelEvent> cancel;
    } m_touchEvents;

    WP<ITouch> m_self;
};
