#ifndef __UV_CURVES_H__
#define __UV_CURVES_H__

#include <vector>
#include "SDL.h"

namespace RatCircle
{
    ////////////////////////////////////////////
    // CIRCLE ART USING RATIONAL PARAMETRIZATION
    ////////////////////////////////////////////
    constexpr int N = 6;                                // Points in a quarter circle

    float x(int n, int d);                              // t=n/d : x(t) on the unit circle
    float y(int n, int d);                              // t=n/d : y(t) on the unit circle
    // Closed outline: 4*n points plus the first point again (for DrawLines)
    std::vector<SDL_FPoint> outline(SDL_FPoint center, float radius, int n = N);
}

namespace Dcb
{ // de Casteljau-Bezier curves
    SDL_FPoint lerp(SDL_FPoint a, SDL_FPoint b, float t);
    std::vector<SDL_FPoint> quadratic(SDL_FPoint P0, SDL_FPoint P1, SDL_FPoint P2, int K);
}

#endif // __UV_CURVES_H__
