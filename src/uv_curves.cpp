#include "uv_curves.h"

float RatCircle::x(int n, int d)
{ // Parameter t = n/d, return x(t) for a circle
    /* *************DOC***************
     * Return x(t) for a unit circle parametrized with t
     *
     *      ------------------
     *      |         1-t*t  |
     *      | x(t) = ------- |
     *      |         1+t*t  |
     *      ------------------
     *
     * No trig: t from 0 to 1 sweeps the first quarter circle.
     * *******************************/
    float t = static_cast<float>(n)/static_cast<float>(d);
    return (1-(t*t))/(1+(t*t));
}
float RatCircle::y(int n, int d)
{ // Parameter t = n/d, return y(t) for a circle
    /* *************DOC***************
     * Return y(t) for a unit circle parametrized with t
     *
     *      ------------------
     *      |           2*t  |
     *      | y(t) = ------- |
     *      |         1+t*t  |
     *      ------------------
     * *******************************/
    float t = static_cast<float>(n)/static_cast<float>(d);
    return (2*t)/(1+(t*t));
}
std::vector<SDL_FPoint> RatCircle::outline(SDL_FPoint center, float radius, int n)
{
    if (n < 1) n = 1;
    const int COUNT = 4*n;
    std::vector<SDL_FPoint> points(COUNT+1);
    // Make a quarter circle
    for(int i=0; i<n; i++)
    {
        points[i] = SDL_FPoint{.x=x(i,n), .y=y(i,n)};
    }
    // Make the other three-quarters of the circle
    for(int i=n; i<COUNT; i++)
    { // Next point is the point n indices back, rotated a quarter-circle
        points[i] = SDL_FPoint{.x=-1*points[i-n].y, .y=points[i-n].x};
    }
    // Offset and scale the circle of points
    for(int i=0; i<COUNT; i++)
    {
        points[i] = SDL_FPoint{
            .x = (radius*points[i].x) + center.x,
            .y = (radius*points[i].y) + center.y };
    }
    // Set final point = initial point to close the shape
    points[COUNT] = points[0];
    return points;
}

SDL_FPoint Dcb::lerp(SDL_FPoint a, SDL_FPoint b, float t)
{
    return SDL_FPoint{.x=(1-t)*a.x + t*b.x, .y=(1-t)*a.y + t*b.y};
}
std::vector<SDL_FPoint> Dcb::quadratic(SDL_FPoint P0, SDL_FPoint P1, SDL_FPoint P2, int K)
{
    /* *************DOC***************
     * Sample a 2nd-order dCB curve at K+1 points, t=0 to t=1 inclusive.
     *
     * Q0 traces the JOIN (P0,P1), Q1 traces the JOIN (P1,P2),
     * the curve point traces the JOIN (Q0,Q1).
     * *******************************/
    if (K < 1) K = 1;
    std::vector<SDL_FPoint> points(K+1);
    for(int i=0; i<=K; i++)
    {
        float t = static_cast<float>(i)/static_cast<float>(K);
        SDL_FPoint Q0 = lerp(P0, P1, t);
        SDL_FPoint Q1 = lerp(P1, P2, t);
        points[i] = lerp(Q0, Q1, t);
    }
    return points;
}
