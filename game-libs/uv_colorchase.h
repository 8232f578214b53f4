#ifndef __UV_COLORCHASE_H__
#define __UV_COLORCHASE_H__

#include <random>
#include "uv_input.h"

namespace ColorChase
{ // Mix RGB to match a target color that will not hold still

    constexpr Uint32 TICK_MS = 150;
    constexpr int DRIFT = 2;                            // Max change per channel per tick
    constexpr int RESET_LO = 50;                        // New targets stay away from the extremes
    constexpr int RESET_HI = 200;
    constexpr Uint8 MIDPOINT = 128;                     // Where the channel tracks start
    // Distance from black to white: sqrt(3 * 255^2)
    constexpr float MAX_DISTANCE = 441.672955930063709849498817084;
    enum { RED, GREEN, BLUE, NCHANNELS };

    struct State
    {
        SDL_FRect bounds;                               // Swatches on top, channel tracks below
        SDL_Color target;                               // Drifts by itself
        SDL_Color current;                              // Set by the player
        int held_channel;                               // Track being dragged, -1 : none
        std::minstd_rand rng;
    };

    State make(SDL_FRect bounds, unsigned seed);
    float distance(SDL_Color a, SDL_Color b);           // Euclidean, in RGB space
    int volume(SDL_Color target, SDL_Color current);
    SDL_FRect track(const SDL_FRect& bounds, int channel);
    SDL_FRect swatch(const SDL_FRect& bounds, bool target);
    State set_channel(State s, int channel, int value, const Volume::Sink& emit);
    State reset_challenge(State s, const Volume::Sink& emit);
    State step(State s, const Input::Event& e, const Volume::Sink& emit);
}

#endif // __UV_COLORCHASE_H__
