#ifndef __UV_TILT_H__
#define __UV_TILT_H__

#include "uv_input.h"

namespace Tilt
{ // Drag to tilt a bar. A ball rolls along it. Where the ball rests is the volume.

    constexpr Uint32 TICK_MS = 16;
    constexpr float SMOOTHING = 0.1;                    // Fraction of the angle error closed per tick
    constexpr float GRAVITY = 0.007;                    // G : acceleration along the bar at 90deg
    constexpr float FRICTION = 0.985;                   // Velocity kept per tick
    constexpr float BOUNCE_LOSS = 0.4;                  // Velocity kept (and reversed) at the ends

    struct State
    {
        SDL_FRect bounds;                               // Widget size, pivot at the center
        float angle;                                    // Bar angle [-pi:pi]
        float target_angle;                             // Angle the bar is easing towards
        float ball_pos;                                 // Ball on the bar [-1:1]
        float ball_vel;                                 // Ball speed along the bar per tick
        bool dragging;
    };

    State make(SDL_FRect bounds);
    float wrap(float a);                                // Wrap any angle into [-pi:pi]
    int volume(const State& s);
    State step(State s, const Input::Event& e, const Volume::Sink& emit);
}

#endif // __UV_TILT_H__
