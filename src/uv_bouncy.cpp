#include <algorithm>
#include <cmath>
#include "uv_bouncy.h"

namespace
{
    void remember(Bouncy::State& s, SDL_FPoint p)
    {
        s.history.push_back(p);
        while (s.history.size() > Bouncy::HISTORY) s.history.pop_front();
    }

    bool reflect(float& pos, float& vel, float lo, float hi)
    { // Returns true if the contact was hard enough to count
        if (  (pos >= lo) && (pos <= hi)  ) return false;
        bool counts = std::fabs(vel) > Bouncy::BOUNCE_MIN;
        pos = Geom::clampf(pos, lo, hi);
        vel *= -Bouncy::RESTITUTION;
        return counts;
    }

    Bouncy::State physics(Bouncy::State s, const Volume::Sink& emit)
    {
        if (!s.animating) return s;
        SDL_FRect a = Bouncy::arena(s.bounds);
        float floor = a.y + a.h;

        s.vel.y += Bouncy::GRAVITY;
        s.pos.x += s.vel.x;
        s.pos.y += s.vel.y;

        int counted = 0;
        if (reflect(s.pos.x, s.vel.x, a.x, a.x+a.w)) counted++;
        if (reflect(s.pos.y, s.vel.y, a.y, floor)) counted++;
        if (counted > 0)
        {
            s.bounces += counted;
            Volume::emit(emit, std::min(Volume::MAX, s.bounces));
        }
        if (  (s.pos.y >= floor) && (std::fabs(s.vel.y) < Bouncy::SETTLE_SPEED)  )
        { // Too soft to leave the floor again: roll
            s.vel.y = 0;
        }

        bool on_floor = s.pos.y >= floor - Bouncy::FLOOR_SLOP;
        if (on_floor) s.vel.x *= Bouncy::ROLL_FRICTION;
        if (  on_floor && (Geom::length(s.vel) < Bouncy::REST_SPEED)  )
        { // At rest
            s.pos.y = floor;
            s.vel = SDL_FPoint{0,0};
            s.animating = false;
        }
        return s;
    }
}

Bouncy::State Bouncy::make(SDL_FRect bounds)
{
    SDL_FRect a = arena(bounds);
    return State{
        .bounds=bounds,
        .pos={.x=a.x + a.w/2, .y=a.y + a.h},           // Resting on the floor
        .vel={0,0},
        .bounces=0,
        .held=false,
        .animating=false,
        .history={}};
}
SDL_FRect Bouncy::arena(const SDL_FRect& b)
{
    float w = std::max(0.0f, b.w - 2*RADIUS);
    float h = std::max(0.0f, b.h - 2*RADIUS);
    return SDL_FRect{.x=b.x+RADIUS, .y=b.y+RADIUS, .w=w, .h=h};
}
SDL_FPoint Bouncy::fling(const std::deque<SDL_FPoint>& history)
{ // Newest minus oldest, scaled
    if (history.size() < 2) return SDL_FPoint{0,0};
    SDL_FPoint first = history.front();
    SDL_FPoint last = history.back();
    return SDL_FPoint{.x=(last.x - first.x)*FLING, .y=(last.y - first.y)*FLING};
}
Bouncy::State Bouncy::step(State s, const Input::Event& e, const Volume::Sink& emit)
{
    switch(e.kind)
    {
        case Input::Kind::PointerDown:
            // Grab: stop everything and start over from zero
            s.animating = false;
            s.held = true;
            s.vel = SDL_FPoint{0,0};
            s.bounces = 0;
            Volume::emit(emit, 0);
            s.pos = Geom::clamp_to(e.pos, arena(s.bounds));
            s.history.clear();
            remember(s, s.pos);
            return s;
        case Input::Kind::PointerMove:
            if (!s.held) return s;
            s.pos = Geom::clamp_to(e.pos, arena(s.bounds));
            remember(s, s.pos);
            return s;
        case Input::Kind::PointerUp:
            if (!s.held) return s;
            s.held = false;
            s.pos = Geom::clamp_to(e.pos, arena(s.bounds));
            remember(s, s.pos);
            s.vel = fling(s.history);
            s.history.clear();
            s.animating = true;
            return s;
        case Input::Kind::Tick:
            return physics(s, emit);
    }
    return s;
}
