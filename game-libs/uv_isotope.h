#ifndef __UV_ISOTOPE_H__
#define __UV_ISOTOPE_H__

#include "uv_input.h"

namespace Isotope
{ // A slider that will not stay put: the value decays towards zero

    constexpr Uint32 TICK_MS = 50;
    constexpr float DECAY = 0.25;                       // Per tick, 5.0 per second
    constexpr float START = 100;

    struct State
    {
        SDL_FRect bounds;                               // Track spans the widget
        float value;                                    // True value [0:100], never goes up by itself
        int shown;                                      // floor(value), last emitted
        bool dragging;
    };

    State make(SDL_FRect bounds);
    State set(State s, int value, const Volume::Sink& emit);
    State step(State s, const Input::Event& e, const Volume::Sink& emit);
}

#endif // __UV_ISOTOPE_H__
