#include <cmath>
#include "uv_slingshot.h"

namespace
{
    Slingshot::State release(Slingshot::State s, SDL_FPoint p, const Volume::Sink& emit)
    {
        if (!s.dragging) return s;                      // No pull to let go of
        s.dragging = false;
        s.drag = Geom::clamp_to(p, s.bounds);
        SDL_FPoint pull = {.x=s.anchor.x - s.drag.x, .y=s.anchor.y - s.drag.y};
        float len = Geom::length(pull);
        Volume::emit(emit, Slingshot::volume(len));
        if (len == 0)
        { // Nothing to launch, leave it sitting in the pouch
            s.pos = s.anchor;
            s.vel = SDL_FPoint{0,0};
            return s;
        }
        s.pos = s.drag;
        s.vel = SDL_FPoint{
            .x=pull.x*Slingshot::LAUNCH_STRENGTH,
            .y=pull.y*Slingshot::LAUNCH_STRENGTH};
        s.firing = true;
        return s;
    }

    Slingshot::State fly(Slingshot::State s)
    {
        if (!s.firing) return s;
        const SDL_FRect& b = s.bounds;
        float left = b.x; float right = b.x+b.w;
        float top = b.y;  float floor = b.y+b.h;

        s.vel.y += Slingshot::GRAVITY;
        s.pos.x += s.vel.x;
        s.pos.y += s.vel.y;

        // Each axis bounces on its own
        if (  (s.pos.x < left) || (s.pos.x > right)  )
        {
            s.pos.x = Geom::clampf(s.pos.x, left, right);
            s.vel.x *= -Slingshot::RESTITUTION;
        }
        if (  (s.pos.y < top) || (s.pos.y > floor)  )
        {
            s.pos.y = Geom::clampf(s.pos.y, top, floor);
            s.vel.y *= -Slingshot::RESTITUTION;
        }

        if (  (Geom::length(s.vel) < Slingshot::REST_SPEED) && (s.pos.y >= floor - Slingshot::FLOOR_SLOP)  )
        { // Came to rest: idle until the next pull
            s.vel = SDL_FPoint{0,0};
            s.firing = false;
        }
        return s;
    }
}

Slingshot::State Slingshot::make(SDL_FRect b)
{
    SDL_FPoint anchor = {.x=b.x + b.w/2, .y=b.y + 2*b.h/3};
    return State{
        .bounds=b, .anchor=anchor, .drag=anchor,
        .pos=anchor, .vel={0,0},
        .dragging=false, .firing=false};
}
int Slingshot::volume(float pullback)
{
    return Volume::clamp(static_cast<int>(std::lround(100*pullback/FULL_PULL)));
}
Slingshot::State Slingshot::step(State s, const Input::Event& e, const Volume::Sink& emit)
{
    switch(e.kind)
    {
        case Input::Kind::PointerDown:
            // Grab: whatever was flying is gone
            s.firing = false;
            s.vel = SDL_FPoint{0,0};
            s.dragging = true;
            s.drag = Geom::clamp_to(e.pos, s.bounds);
            s.pos = s.drag;
            return s;
        case Input::Kind::PointerMove:
            if (!s.dragging) return s;
            s.drag = Geom::clamp_to(e.pos, s.bounds);
            s.pos = s.drag;
            return s;
        case Input::Kind::PointerUp:
            return release(s, e.pos, emit);
        case Input::Kind::Tick:
            return fly(s);
    }
    return s;
}
