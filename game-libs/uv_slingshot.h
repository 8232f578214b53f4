#ifndef __UV_SLINGSHOT_H__
#define __UV_SLINGSHOT_H__

#include "uv_input.h"

namespace Slingshot
{ // Pull back and let go. How far you pulled is the volume. Then watch it fly.

    constexpr Uint32 TICK_MS = 16;
    constexpr float FULL_PULL = 200;                    // Pullback length for volume 100
    constexpr float LAUNCH_STRENGTH = 0.15;             // Launch velocity per pixel of pullback
    constexpr float GRAVITY = 0.1;                      // Added to vertical velocity per tick
    constexpr float RESTITUTION = 0.85;                 // Velocity kept (and reversed) at a wall
    constexpr float REST_SPEED = 0.5;                   // Slower than this on the floor: stop
    constexpr float FLOOR_SLOP = 1;                     // Pixels above the floor that count as on it

    struct State
    {
        SDL_FRect bounds;                               // Walls, floor and ceiling
        SDL_FPoint anchor;                              // Where the band is tied
        SDL_FPoint drag;                                // Pointer while pulling
        SDL_FPoint pos;                                 // Projectile
        SDL_FPoint vel;                                 // Projectile velocity per tick
        bool dragging;
        bool firing;                                    // Never both dragging and firing
    };

    State make(SDL_FRect bounds);
    int volume(float pullback);
    State step(State s, const Input::Event& e, const Volume::Sink& emit);
}

#endif // __UV_SLINGSHOT_H__
