#ifndef __UV_COLORS_H__
#define __UV_COLORS_H__

#include "SDL.h"

namespace Colors
{ // Paper-and-ink menu look, plus a few loud colors for the controls
    /* *************Colors from Steve Losh badwolf.vim***************
     * A Vim colorscheme pieced together by Steve Losh.
     * Available at http://stevelosh.com/projects/badwolf/
     * *******************************/

    // Greys
    constexpr SDL_Color snow           = {0xff,0xff,0xff,0xff};
    constexpr SDL_Color coal           = {0x00,0x00,0x00,0xff};
    constexpr SDL_Color plain          = {0xf8,0xf6,0xf2,0xff};
    constexpr SDL_Color brightgravel   = {0xd9,0xce,0xc3,0xff};
    constexpr SDL_Color lightgravel    = {0x99,0x8f,0x84,0xff};
    constexpr SDL_Color deepgravel     = {0x45,0x41,0x3b,0xff};

    // Colors
    constexpr SDL_Color taffy          = {0xff,0x2c,0x4b,0xff};
    constexpr SDL_Color saltwatertaffy = {0x8c,0xff,0xba,0xff};
    constexpr SDL_Color tardis         = {0x0a,0x9d,0xff,0xff};
    constexpr SDL_Color orange         = {0xff,0xa7,0x24,0xff};
    constexpr SDL_Color lime           = {0xae,0xee,0x00,0xff};

    ////////
    // THEME
    ////////
    constexpr SDL_Color page           = snow;          // Page background
    constexpr SDL_Color ink            = coal;          // Text and borders
    constexpr SDL_Color disabled_ink   = lightgravel;   // Placeholder tiles
    constexpr SDL_Color disabled_fill  = plain;
    constexpr SDL_Color track          = brightgravel;  // Slider grooves
    constexpr SDL_Color handle         = deepgravel;

    // Channel colors for the RGB tracks
    constexpr SDL_Color channel[] = {taffy, lime, tardis};

    inline int luma(SDL_Color c)
    { // Perceived brightness 0-255 (integer Rec.601 weights)
        return (c.r*30 + c.g*59 + c.b*11)/100;
    }

    inline SDL_Color contrasts(SDL_Color bg)
    { // coal on light colors, snow on dark colors
        return (luma(bg) >= 128) ? coal : snow;
    }
}

#endif // __UV_COLORS_H__
