#include "uv_clock.h"

Clock::Ticker::Ticker(Uint32 period)
{
    period_ms = (period == 0) ? 1 : period;             // 0 would tick forever
    acc_ms = 0;
}
int Clock::Ticker::advance(Uint32 dt_ms)
{
    /* *************DOC***************
     * Return how many ticks are due after dt_ms more milliseconds.
     *
     * The remainder carries over to the next call, so a 16ms ticker
     * driven by a 60fps loop still averages one tick per 16ms.
     *
     * A stalled frame (window drag, debugger) owes a lot of ticks.
     * Pay at most MAX_CATCHUP of them and drop the rest of the debt.
     * *******************************/
    acc_ms += dt_ms;
    int due = static_cast<int>(acc_ms / period_ms);
    acc_ms -= static_cast<Uint32>(due) * period_ms;
    if (due > MAX_CATCHUP)
    { // Too far behind: do not try to catch up
        due = MAX_CATCHUP;
        acc_ms = 0;
    }
    return due;
}
void Clock::Ticker::reset(void)
{
    acc_ms = 0;
}
