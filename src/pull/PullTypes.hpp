#pragma once

#include <chrono>
#include <cstdint>

enum ePullStatus : uint8_t {
    PULL_STATUS_IDLE = 0, // bottom only, before init
    PULL_STATUS_PULL,
    PULL_STATUS_DROP,
    PULL_STATUS_LOADING,
};

enum ePullEdge : uint8_t {
    PULL_EDGE_NONE = 0,
    PULL_EDGE_TOP,
    PULL_EDGE_BOTTOM,
};

// offset held while a loader is in flight, positive for top and negative for bottom
constexpr const float SETTLE_OFFSET = 50.F;

// top stays "loading" this long after completion so the collapse can finish before the next drag
constexpr const auto  TOP_RESET_DELAY = std::chrono::milliseconds(200);

inline const char*    toString(ePullStatus s) {
    switch (s) {
        case PULL_STATUS_IDLE: return "idle";
        case PULL_STATUS_PULL: return "pull";
        case PULL_STATUS_DROP: return "drop";
        case PULL_STATUS_LOADING: return "loading";
    }
    return "ERROR";
}

inline const char* toString(ePullEdge e) {
    switch (e) {
        case PULL_EDGE_NONE: return "none";
        case PULL_EDGE_TOP: return "top";
        case PULL_EDGE_BOTTOM: return "bottom";
    }
    return "ERROR";
}
