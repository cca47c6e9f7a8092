#pragma once

#include <cstdint>

namespace Math {
    // vertical drag direction of a touch session
    enum eDirection : int8_t {
        DIRECTION_NONE = -1,
        DIRECTION_UP,
        DIRECTION_DOWN,
    };

    inline eDirection fromDelta(double delta) {
        return delta > 0 ? DIRECTION_DOWN : DIRECTION_UP;
    }

    inline const char* toString(eDirection d) {
        switch (d) {
            case DIRECTION_UP: return "up";
            case DIRECTION_DOWN: return "down";
            default: return "none";
        }
    }
};
