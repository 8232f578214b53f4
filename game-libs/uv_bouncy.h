#ifndef __UV_BOUNCY_H__
#define __UV_BOUNCY_H__

#include <deque>
#include "uv_input.h"

namespace Bouncy
{ // Fling the ball. Every good bounce turns the volume up by one.

    constexpr Uint32 TICK_MS = 16;
    constexpr float RADIUS = 12;
    constexpr float GRAVITY = 0.5;                      // Added to vertical velocity per tick
    constexpr float RESTITUTION = 0.8;                  // Velocity kept (and reversed) on contact
    constexpr float FLING = 0.2;                        // Release velocity per pixel of recent travel
    constexpr size_t HISTORY = 5;                       // Pointer samples kept for the fling
    constexpr float BOUNCE_MIN = 1.5;                   // Softer contacts do not count
    constexpr float REST_SPEED = 0.1;                   // Slower than this on the floor: stop
    constexpr float FLOOR_SLOP = 1;                     // Pixels above the floor that count as on it
    constexpr float SETTLE_SPEED = 1;                   // Floor rebounds slower than this die out
    constexpr float ROLL_FRICTION = 0.98;               // Horizontal velocity kept per tick on the floor

    struct State
    {
        SDL_FRect bounds;
        SDL_FPoint pos;                                 // Ball center
        SDL_FPoint vel;                                 // Per tick
        int bounces;                                    // Counted bounces since the last grab
        bool held;                                      // Pointer is down on it
        bool animating;
        std::deque<SDL_FPoint> history;                 // Oldest first, at most HISTORY
    };

    State make(SDL_FRect bounds);
    SDL_FRect arena(const SDL_FRect& bounds);           // Where the ball center may go
    SDL_FPoint fling(const std::deque<SDL_FPoint>& history);
    State step(State s, const Input::Event& e, const Volume::Sink& emit);
}

#endif // __UV_BOUNCY_H__
