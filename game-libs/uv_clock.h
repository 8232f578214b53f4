#ifndef __UV_CLOCK_H__
#define __UV_CLOCK_H__

#include "SDL.h"

namespace Clock
{ // Physics loops that run at their own speed, independent of VSYNC

    constexpr int MAX_CATCHUP = 8;                      // Most ticks one frame may owe

    struct Ticker
    { // Turns elapsed milliseconds into a whole number of ticks
        Uint32 period_ms;                               // Time per tick
        Uint32 acc_ms;                                  // Leftover time, not a full tick yet

        Ticker(Uint32 period);
        int advance(Uint32 dt_ms);                      // Add elapsed time, return ticks due
        void reset(void);                               // Forget leftover time
    };
}

#endif // __UV_CLOCK_H__
