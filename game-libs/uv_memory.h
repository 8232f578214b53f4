#ifndef __UV_MEMORY_H__
#define __UV_MEMORY_H__

#include <array>
#include <random>
#include "uv_input.h"

namespace Memory
{ // Match pairs. Every pair found is another eighth of the volume.

    constexpr Uint32 TICK_MS = 100;
    constexpr int COLS = 4;
    constexpr int ROWS = 4;
    constexpr int NCARDS = COLS*ROWS;
    constexpr int NPAIRS = NCARDS/2;
    constexpr int HIDE_TICKS = 10;                      // A mismatch stays face-up ~1s
    constexpr int NONE = -1;

    struct Card
    {
        char symbol;                                    // 'A' to 'H', two of each
        bool face_up;
        bool matched;                                   // Matched cards are out of play
    };

    struct State
    {
        SDL_FRect bounds;                               // COLS x ROWS grid of cells
        std::array<Card, NCARDS> cards;
        int first;                                      // Index of first pick, NONE : none
        int second;                                     // Index of second pick, NONE : none
        int matched_pairs;                              // [0:NPAIRS]
        int hide_in;                                    // Ticks until a mismatch turns back over
        std::minstd_rand rng;
    };

    State make(SDL_FRect bounds, unsigned seed);
    State deal(State s, const Volume::Sink& emit);      // Shuffle and start over
    State select(State s, int index, const Volume::Sink& emit);
    SDL_FRect cell(const SDL_FRect& bounds, int index);
    int cell_at(const SDL_FRect& bounds, SDL_FPoint p); // NONE if p misses the grid
    int volume(int matched_pairs);
    State step(State s, const Input::Event& e, const Volume::Sink& emit);
}

#endif // __UV_MEMORY_H__
