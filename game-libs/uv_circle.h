#ifndef __UV_CIRCLE_H__
#define __UV_CIRCLE_H__

#include <vector>
#include "uv_input.h"

namespace CircleGrader
{ // Draw a circle by hand. The rounder it is, the louder.

    constexpr Uint32 TICK_MS = 100;
    constexpr size_t MIN_POINTS = 10;                   // Fewer: not a circle, not graded
    constexpr int CLEAR_TICKS = 10;                     // Finished stroke stays up ~1s
    // Calibration: perfection 1.0 -> 100, perfection 1/3 or less -> 0
    constexpr float SCORE_GAIN = 150;
    constexpr float SCORE_OFFSET = -50;

    struct Stats
    {
        SDL_FPoint centroid;
        float mean_radius;
        float stddev;                                   // Population standard deviation of radii
    };

    struct State
    {
        SDL_FRect bounds;
        std::vector<SDL_FPoint> stroke;                 // Ordered samples, pointer down to up
        bool drawing;
        int clear_in;                                   // Ticks until the stroke is wiped, 0 : none
        int last_score;                                 // -1 : nothing graded yet
    };

    State make(SDL_FRect bounds);
    Stats measure(const std::vector<SDL_FPoint>& stroke);
    int score(const std::vector<SDL_FPoint>& stroke);   // Assumes at least MIN_POINTS
    State step(State s, const Input::Event& e, const Volume::Sink& emit);
}

#endif // __UV_CIRCLE_H__
