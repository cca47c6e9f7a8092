#include "Time.hpp"

#define chr std::chrono

Time::steady_tp Time::steadyNow() {
    return chr::steady_clock::now();
}

Time::steady_dur Time::fromMillis(uint64_t ms) {
    return chr::duration_cast<steady_dur>(chr::milliseconds(ms));
}
