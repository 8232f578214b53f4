#include "uv_scramble.h"

Scramble::Label::Label(const std::string& t, Uint32 s, unsigned seed, const std::string& cs)
    : original(t), charset(cs), text(), revealed(0),
      animating(false), in_view(false), speed_ms(s), rng(seed)
{
    if (charset.empty()) charset = CHARSET;             // Need something to scramble with
    reset_scramble();
}
char Scramble::Label::random_char(void)
{
    std::uniform_int_distribution<size_t> pick(0, charset.size()-1);
    return charset[pick(rng)];
}
void Scramble::Label::rescramble_tail(void)
{
    text = original.substr(0, revealed);
    for (size_t i=revealed; i<original.size(); i++) text.push_back(random_char());
}
void Scramble::Label::set_original_text(const std::string& t)
{
    original = t;
    reset_scramble();
}
void Scramble::Label::start_decryption(void)
{ // Idempotent while revealing
    if (animating) return;
    if (original.empty()) return;
    animating = true;
    revealed = 0;
}
void Scramble::Label::reset_scramble(void)
{ // Cancel any reveal and scramble the whole string
    animating = false;
    revealed = 0;
    rescramble_tail();
}
void Scramble::Label::tick(void)
{
    /* *************DOC***************
     * One reveal step: show one more letter of the original, then
     * re-roll every placeholder letter still hidden.
     *
     * The tick that reveals the last letter also ends the animation,
     * so `animating` is never true with the full text showing.
     * *******************************/
    if (!animating) return;
    if (revealed < original.size()) revealed++;
    rescramble_tail();
    if (revealed_all())
    { // Done: Revealing -> Revealed
        animating = false;
        text = original;
    }
}
bool Scramble::Label::revealed_all(void) const
{
    return revealed >= original.size();
}
