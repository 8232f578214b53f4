#include <cmath>
#include "uv_colorchase.h"

namespace
{
    Uint8& channel_of(SDL_Color& c, int channel)
    {
        switch(channel)
        {
            case ColorChase::RED:   return c.r;
            case ColorChase::GREEN: return c.g;
            default:                return c.b;
        }
    }

    Uint8 to_byte(int v)
    {
        if (v < 0) return 0;
        if (v > 255) return 255;
        return static_cast<Uint8>(v);
    }

    int value_at(const SDL_FRect& t, float x)
    { // Position along a track -> channel value 0-255
        float f = Geom::clampf((x - t.x)/t.w, 0, 1);
        return static_cast<int>(std::lround(255*f));
    }

    ColorChase::State drift(ColorChase::State s)
    { // Random walk, every channel on its own
        std::uniform_int_distribution<int> d(-ColorChase::DRIFT, ColorChase::DRIFT);
        for (int ch=0; ch<ColorChase::NCHANNELS; ch++)
        {
            Uint8& c = channel_of(s.target, ch);
            c = to_byte(c + d(s.rng));
        }
        return s;
    }

    int hit_track(const SDL_FRect& bounds, SDL_FPoint p)
    {
        for (int ch=0; ch<ColorChase::NCHANNELS; ch++)
        {
            if (Geom::contains(ColorChase::track(bounds, ch), p)) return ch;
        }
        return -1;
    }
}

ColorChase::State ColorChase::make(SDL_FRect bounds, unsigned seed)
{
    State s{
        .bounds=bounds,
        .target={0,0,0,255},
        .current={MIDPOINT,MIDPOINT,MIDPOINT,255},
        .held_channel=-1,
        .rng=std::minstd_rand(seed)};
    return reset_challenge(s, Volume::Sink());
}
float ColorChase::distance(SDL_Color a, SDL_Color b)
{
    float dr = static_cast<float>(a.r) - b.r;
    float dg = static_cast<float>(a.g) - b.g;
    float db = static_cast<float>(a.b) - b.b;
    return std::sqrt(dr*dr + dg*dg + db*db);
}
int ColorChase::volume(SDL_Color target, SDL_Color current)
{
    float similarity = 1 - distance(target, current)/MAX_DISTANCE;
    return Volume::clamp(static_cast<int>(100*similarity));
}
SDL_FRect ColorChase::track(const SDL_FRect& b, int channel)
{ // Three tracks stacked in the bottom half
    float M = 0.05*b.w;                                 // M : Margin in pixels
    float row = b.h/2/static_cast<float>(NCHANNELS);
    return SDL_FRect{
        .x=b.x+M,
        .y=b.y + b.h/2 + channel*row + row/4,
        .w=b.w-2*M,
        .h=row/2};
}
SDL_FRect ColorChase::swatch(const SDL_FRect& b, bool target)
{ // Two swatches side by side in the top half
    float M = 0.05*b.w;
    float w = (b.w - 3*M)/2;
    return SDL_FRect{
        .x=b.x + M + (target ? 0 : w+M),
        .y=b.y + M,
        .w=w,
        .h=b.h/2 - 2*M};
}
ColorChase::State ColorChase::set_channel(State s, int channel, int value, const Volume::Sink& emit)
{
    if (  (channel < 0) || (channel >= NCHANNELS)  ) return s;
    channel_of(s.current, channel) = to_byte(value);
    Volume::emit(emit, volume(s.target, s.current));
    return s;
}
ColorChase::State ColorChase::reset_challenge(State s, const Volume::Sink& emit)
{
    /* *************DOC***************
     * New random target in [RESET_LO:RESET_HI] per channel, every
     * track back at MIDPOINT. The volume is emitted once, after the
     * whole reset, never for the half-reset color in between.
     * *******************************/
    std::uniform_int_distribution<int> pick(RESET_LO, RESET_HI);
    s.target = SDL_Color{to_byte(pick(s.rng)), to_byte(pick(s.rng)), to_byte(pick(s.rng)), 255};
    s.current = SDL_Color{MIDPOINT, MIDPOINT, MIDPOINT, 255};
    s.held_channel = -1;
    Volume::emit(emit, volume(s.target, s.current));
    return s;
}
ColorChase::State ColorChase::step(State s, const Input::Event& e, const Volume::Sink& emit)
{
    switch(e.kind)
    {
        case Input::Kind::PointerDown:
            s.held_channel = hit_track(s.bounds, e.pos);
            if (s.held_channel < 0) return s;
            return set_channel(s, s.held_channel, value_at(track(s.bounds, s.held_channel), e.pos.x), emit);
        case Input::Kind::PointerMove:
            if (s.held_channel < 0) return s;
            return set_channel(s, s.held_channel, value_at(track(s.bounds, s.held_channel), e.pos.x), emit);
        case Input::Kind::PointerUp:
            s.held_channel = -1;
            return s;
        case Input::Kind::Tick:
            s = drift(s);
            Volume::emit(emit, volume(s.target, s.current));
            return s;
    }
    return s;
}
