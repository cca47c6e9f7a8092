#pragma once

#include <chrono>
#include <cstdint>

//NOLINTNEXTLINE
namespace Time {
    using steady_tp  = std::chrono::steady_clock::time_point;
    using steady_dur = std::chrono::steady_clock::duration;

    steady_tp steadyNow();

    // ms -> steady duration
    steady_dur fromMillis(uint64_t ms);
};
