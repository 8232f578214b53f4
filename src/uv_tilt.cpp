#include <cmath>
#include "uv_tilt.h"

namespace
{
    constexpr float PI = 3.14159265358979f;

    Tilt::State aim(Tilt::State s, SDL_FPoint p)
    { // Point the bar at the pointer, relative to the pivot
        float dx = p.x - (s.bounds.x + s.bounds.w/2);
        float dy = p.y - (s.bounds.y + s.bounds.h/2);
        if (  (dx == 0) && (dy == 0)  ) return s;       // No direction at the pivot
        s.target_angle = std::atan2(dy, dx);
        return s;
    }

    Tilt::State physics(Tilt::State s)
    {
        // Ease the bar towards the target along the short way round
        s.angle = Tilt::wrap(s.angle + Tilt::wrap(s.target_angle - s.angle)*Tilt::SMOOTHING);

        // Roll the ball
        s.ball_vel += Tilt::GRAVITY*std::sin(s.angle);
        s.ball_vel *= Tilt::FRICTION;
        s.ball_pos += s.ball_vel;

        // Bounce off the ends of the bar
        if (s.ball_pos > 1.0f)
        {
            s.ball_pos = 1.0f;
            s.ball_vel *= -Tilt::BOUNCE_LOSS;
        }
        else if (s.ball_pos < -1.0f)
        {
            s.ball_pos = -1.0f;
            s.ball_vel *= -Tilt::BOUNCE_LOSS;
        }
        return s;
    }
}

Tilt::State Tilt::make(SDL_FRect bounds)
{
    return State{
        .bounds=bounds,
        .angle=0, .target_angle=0,
        .ball_pos=0, .ball_vel=0,
        .dragging=false};
}
float Tilt::wrap(float a)
{
    // fmod keeps huge inputs cheap, then fold into [-pi:pi]
    a = std::fmod(a, 2*PI);
    if (a > PI) a -= 2*PI;
    if (a < -PI) a += 2*PI;
    return a;
}
int Tilt::volume(const State& s)
{ // Ball at the -1 end is loud, ball at the +1 end is silent
    return Volume::clamp(static_cast<int>(std::lround(50*(1-s.ball_pos))));
}
Tilt::State Tilt::step(State s, const Input::Event& e, const Volume::Sink& emit)
{
    switch(e.kind)
    {
        case Input::Kind::PointerDown:
            s.dragging = true;
            return aim(s, e.pos);
        case Input::Kind::PointerMove:
            if (!s.dragging) return s;
            return aim(s, e.pos);
        case Input::Kind::PointerUp:
            s.dragging = false;
            return s;
        case Input::Kind::Tick:
            s = physics(s);
            Volume::emit(emit, volume(s));
            return s;
    }
    return s;
}
