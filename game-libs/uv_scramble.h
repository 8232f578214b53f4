#ifndef __UV_SCRAMBLE_H__
#define __UV_SCRAMBLE_H__

#include <random>
#include <string>
#include "SDL.h"

namespace Scramble
{ // Text that starts out as gibberish and decrypts itself one letter at a time

    constexpr const char* CHARSET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789!@#$%^&*()";

    struct Label
    {
        /////////////
        // GAME STATE
        /////////////
        std::string original;                           // The real text
        std::string charset;                            // Placeholder letters
        std::string text;                               // What is on screen right now
        size_t revealed;                                // Letters of original already shown
        bool animating;                                 // Revealing, one letter per tick
        bool in_view;                                   // Owned by the visibility tracker
        Uint32 speed_ms;                                // Tick period for this label
        std::minstd_rand rng;                           // Picks placeholder letters

        Label(const std::string& text, Uint32 speed_ms, unsigned seed,
              const std::string& charset = CHARSET);

        void set_original_text(const std::string& text); // Replace content and rescramble
        void start_decryption(void);                    // Scrambled -> Revealing
        void reset_scramble(void);                      // Anything -> Scrambled
        void tick(void);                                // Reveal one more letter
        bool revealed_all(void) const;

        private:
        char random_char(void);
        void rescramble_tail(void);                     // Re-roll every letter not revealed yet
    };
}

#endif // __UV_SCRAMBLE_H__
