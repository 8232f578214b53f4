#include <algorithm>
#include <cmath>
#include "uv_memory.h"

namespace
{
    Memory::State hide_mismatch(Memory::State s)
    {
        s.cards[s.first].face_up = false;
        s.cards[s.second].face_up = false;
        s.first = Memory::NONE;
        s.second = Memory::NONE;
        s.hide_in = 0;
        return s;
    }

    Memory::State compare(Memory::State s, const Volume::Sink& emit)
    {
        Memory::Card& a = s.cards[s.first];
        Memory::Card& b = s.cards[s.second];
        if (a.symbol != b.symbol)
        { // Leave them up long enough to be remembered
            s.hide_in = Memory::HIDE_TICKS;
            return s;
        }
        a.matched = true;
        b.matched = true;
        s.matched_pairs++;
        s.first = Memory::NONE;
        s.second = Memory::NONE;
        Volume::emit(emit, Memory::volume(s.matched_pairs));
        return s;
    }
}

Memory::State Memory::make(SDL_FRect bounds, unsigned seed)
{
    State s{};
    s.bounds = bounds;
    s.rng = std::minstd_rand(seed);
    return deal(s, Volume::Sink());
}
Memory::State Memory::deal(State s, const Volume::Sink& emit)
{
    for (int i=0; i<NCARDS; i++)
    { // Two of each symbol, in order
        s.cards[i] = Card{.symbol=static_cast<char>('A' + i/2), .face_up=false, .matched=false};
    }
    std::shuffle(s.cards.begin(), s.cards.end(), s.rng);
    s.first = NONE;
    s.second = NONE;
    s.matched_pairs = 0;
    s.hide_in = 0;
    Volume::emit(emit, 0);
    return s;
}
Memory::State Memory::select(State s, int index, const Volume::Sink& emit)
{
    /* *************DOC***************
     * Turn card `index` face-up if it is in play.
     *
     * Ignored when:
     * - index is off the board
     * - the card is matched (disabled) or already face-up
     * - two unmatched cards are already up, waiting to be hidden
     * *******************************/
    if (  (index < 0) || (index >= NCARDS)  ) return s;
    if (s.second != NONE) return s;
    Card& c = s.cards[index];
    if (c.matched || c.face_up) return s;

    c.face_up = true;
    if (s.first == NONE)
    {
        s.first = index;
        return s;
    }
    s.second = index;
    return compare(s, emit);
}
SDL_FRect Memory::cell(const SDL_FRect& b, int index)
{
    float w = b.w/COLS;
    float h = b.h/ROWS;
    float M = 0.06*std::min(w, h);                      // M : gap around each card
    int col = index % COLS;
    int row = index / COLS;
    return SDL_FRect{.x=b.x + col*w + M, .y=b.y + row*h + M, .w=w-2*M, .h=h-2*M};
}
int Memory::cell_at(const SDL_FRect& b, SDL_FPoint p)
{
    for (int i=0; i<NCARDS; i++)
    {
        if (Geom::contains(cell(b, i), p)) return i;
    }
    return NONE;
}
int Memory::volume(int matched_pairs)
{
    return Volume::clamp(static_cast<int>(std::lround(100.0*matched_pairs/NPAIRS)));
}
Memory::State Memory::step(State s, const Input::Event& e, const Volume::Sink& emit)
{
    switch(e.kind)
    {
        case Input::Kind::PointerDown:
            return select(s, cell_at(s.bounds, e.pos), emit);
        case Input::Kind::Tick:
            if (s.hide_in > 0)
            {
                s.hide_in--;
                if (s.hide_in == 0) s = hide_mismatch(s);
            }
            return s;
        default: return s;
    }
}
