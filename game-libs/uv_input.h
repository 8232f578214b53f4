#ifndef __UV_INPUT_H__
#define __UV_INPUT_H__

#include <cmath>
#include <functional>
#include "SDL.h"

namespace Input
{ // Everything a control ever hears about: pointer events and ticks

    enum class Kind
    {
        PointerDown,
        PointerMove,
        PointerUp,
        Tick                                            // Advance one fixed step
    };

    struct Event
    {
        Kind kind;
        SDL_FPoint pos;                                 // Widget coordinates, ignored by Tick
    };

    inline Event down(float x, float y) { return Event{Kind::PointerDown, SDL_FPoint{x,y}}; }
    inline Event move(float x, float y) { return Event{Kind::PointerMove, SDL_FPoint{x,y}}; }
    inline Event up(float x, float y)   { return Event{Kind::PointerUp,   SDL_FPoint{x,y}}; }
    inline Event tick(void)             { return Event{Kind::Tick,        SDL_FPoint{0,0}}; }
}

namespace Volume
{ // The one thing every control produces: an integer 0-100

    constexpr int MIN = 0;
    constexpr int MAX = 100;

    // Whoever listens. The controls never know who that is.
    using Sink = std::function<void(int)>;

    inline int clamp(int v)
    {
        if (v < MIN) return MIN;
        if (v > MAX) return MAX;
        return v;
    }

    inline void emit(const Sink& sink, int v)
    { // An empty sink just drops the value
        if (sink) sink(clamp(v));
    }
}

namespace Geom
{ // Small 2D helpers shared by the simulators

    inline float length(SDL_FPoint v) { return std::sqrt(v.x*v.x + v.y*v.y); }

    inline float clampf(float v, float lo, float hi)
    {
        if (v < lo) return lo;
        if (v > hi) return hi;
        return v;
    }

    inline SDL_FPoint clamp_to(SDL_FPoint p, const SDL_FRect& r)
    { // Keep p inside r (a resize mid-gesture must not throw anything off)
        return SDL_FPoint{
            .x=clampf(p.x, r.x, r.x+r.w),
            .y=clampf(p.y, r.y, r.y+r.h)};
    }

    inline bool contains(const SDL_FRect& r, SDL_FPoint p)
    {
        return (p.x >= r.x) && (p.x < r.x+r.w) && (p.y >= r.y) && (p.y < r.y+r.h);
    }
}

#endif // __UV_INPUT_H__
