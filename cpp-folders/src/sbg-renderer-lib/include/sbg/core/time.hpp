#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: time.hpp
    MODULE: core
    PURPOSE: Wall-clock delta measurement from a monotonic tick counter.
*/


#include <cstdint>

namespace sbg
{
    struct FrameClock
    {
        uint64_t ticks_prev = 0;
        double tick_hz = 1.0;

        // First call primes the clock and reports zero.
        double begin_frame(uint64_t ticks_now)
        {
            if (ticks_prev == 0)
            {
                ticks_prev = ticks_now;
                return 0.0;
            }
            const double dt = (double)(ticks_now - ticks_prev) / tick_hz;
            ticks_prev = ticks_now;
            return dt;
        }
    };
}
