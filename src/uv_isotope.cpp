#include <cmath>
#include "uv_isotope.h"

namespace
{
    int value_at(const SDL_FRect& b, float x)
    {
        if (b.w <= 0) return 0;
        float f = (x - b.x)/b.w;
        return Volume::clamp(static_cast<int>(std::lround(100*f)));
    }

    Isotope::State decay(Isotope::State s, const Volume::Sink& emit)
    {
        s.value -= Isotope::DECAY;
        if (s.value < 0) s.value = 0;
        int shown = static_cast<int>(std::floor(s.value));
        if (shown != s.shown)
        { // Only tell anyone when the integer changes
            s.shown = shown;
            Volume::emit(emit, shown);
        }
        return s;
    }
}

Isotope::State Isotope::make(SDL_FRect bounds)
{
    return State{
        .bounds=bounds,
        .value=START,
        .shown=static_cast<int>(START),
        .dragging=false};
}
Isotope::State Isotope::set(State s, int value, const Volume::Sink& emit)
{ // Decay picks up again from here
    s.shown = Volume::clamp(value);
    s.value = static_cast<float>(s.shown);
    Volume::emit(emit, s.shown);
    return s;
}
Isotope::State Isotope::step(State s, const Input::Event& e, const Volume::Sink& emit)
{
    switch(e.kind)
    {
        case Input::Kind::PointerDown:
            s.dragging = true;
            return set(s, value_at(s.bounds, e.pos.x), emit);
        case Input::Kind::PointerMove:
            if (!s.dragging) return s;
            return set(s, value_at(s.bounds, e.pos.x), emit);
        case Input::Kind::PointerUp:
            s.dragging = false;
            return s;
        case Input::Kind::Tick:
            return decay(s, emit);
    }
    return s;
}
