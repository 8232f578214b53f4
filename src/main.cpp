#include "uv_readme.h"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <vector>
#include <SDL.h>
#include <SDL_ttf.h>
#include "uv_colors.h"
#include "uv_clock.h"
#include "uv_curves.h"
#include "uv_scramble.h"
#include "uv_visibility.h"
#include "uv_tilt.h"
#include "uv_colorchase.h"
#include "uv_slingshot.h"
#include "uv_isotope.h"
#include "uv_circle.h"
#include "uv_bouncy.h"
#include "uv_memory.h"

// Control whether DEBUG stuff generates code or not
enum { DEBUG = 1 };                                     // USER! Set DEBUG : 0 or 1
constexpr bool DEBUG_UI = false;                        // True: print every pointer event

namespace Log
{ // printf diagnostics, tagged with the source line
    void msg(int line_num, const char* what)
    {
        printf("line %d : %s\n", line_num, what);
    }
    void sdl_error(int line_num)
    {
        printf("line %d : SDL error msg: \"%s\"\n", line_num, SDL_GetError());
    }
    void ttf_error(int line_num)
    {
        printf("line %d : TTF error msg: \"%s\"\n", line_num, TTF_GetError());
    }
}

namespace GameArt
{
    ////////////////
    // CHUNKY PIXELS
    ////////////////
    constexpr int scale = 60;                           // 60*(16:9) = 960:540
    constexpr SDL_Rect rect = {.x=0, .y=0, .w=scale*16, .h=scale*9}; // Game art has a 16:9 aspect ratio
    SDL_Texture* tex;                                   // Render game art to this texture

    //////////////////////////////////////////////
    // FUNCTIONS TO STRETCH TEXTURE OVER OS WINDOW
    //////////////////////////////////////////////
    SDL_Rect center_src_in_win(const SDL_Rect& window, const SDL_Rect& texture);
    SDL_Rect  scale_src_to_win(const SDL_Rect& window, const SDL_Rect& texture);
}
SDL_Rect GameArt::center_src_in_win(const SDL_Rect& winrect, const SDL_Rect& srcrect)
{
    return SDL_Rect {
        .x=(winrect.w - srcrect.w)/2,
        .y=(winrect.h - srcrect.h)/2,
        .w=srcrect.w, .h = srcrect.h};
}
SDL_Rect GameArt::scale_src_to_win(const SDL_Rect& winrect, const SDL_Rect& srcrect)
{
    /* *************DOC***************
     * Return srcrect centered and scaled up to best fit in the winrect.
     *
     * - scale up srcrect without getting too big to fit
     * - maintain an integer scaling factor (avoids visual artifacts)
     *
     * If winrect is smaller than srcrect, do not scale down, just clip
     * srcrect to fit in winrect.
     * *******************************/
    int ratio_w = winrect.w/srcrect.w;
    int ratio_h = winrect.h/srcrect.h;
    if (  (ratio_w==0) || (ratio_h==0)  ) return center_src_in_win(winrect, srcrect);
    int K = (ratio_w > ratio_h) ? ratio_h : ratio_w;
    SDL_Rect scalerect = {.x=0,.y=0,.w = K*srcrect.w,.h = K*srcrect.h};
    return GameArt::center_src_in_win(winrect, scalerect);
}

namespace GtoW
{ // Where the game art landed in the OS window, to map the mouse back
    SDL_Rect dst = GameArt::rect;

    SDL_FPoint to_game(int wx, int wy)
    {
        if (  (dst.w == 0) || (dst.h == 0)  ) return SDL_FPoint{0,0};
        return SDL_FPoint{
            .x=static_cast<float>(wx - dst.x)*GameArt::rect.w/dst.w,
            .y=static_cast<float>(wy - dst.y)*GameArt::rect.h/dst.h};
    }
}

struct WindowInfo
{
    int x,y,w,h;
    Uint32 flags;
    const char* font_path;
    WindowInfo(int argc, char* argv[]);
};

WindowInfo::WindowInfo(int argc, char* argv[])
{ // Window size, location, and behavior to act like a Vim window

    // Set defaults
    x = 50;                                             // Default x
    y = 50;                                             // Default y
    w = GameArt::rect.w;                                // Default w
    h = GameArt::rect.h;                                // Default h
    font_path = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";

    // Overwrite with values, if provided
    if(argc>1) x = atoi(argv[1]);
    if(argc>2) y = atoi(argv[2]);
    if(argc>3) w = atoi(argv[3]);
    if(argc>4) h = atoi(argv[4]);
    if(argc>5) font_path = argv[5];

    // Only do a borderless, always-on-top window if I pass window args
    if(argc>1)
    {
        flags = SDL_WINDOW_BORDERLESS |                 // Look pretty
                SDL_WINDOW_ALWAYS_ON_TOP;               // Stay on top
    }
    else
    {
        flags = SDL_WINDOW_RESIZABLE;                   // Click drag to resize
    }
}

SDL_Window* win;
SDL_Renderer* ren;

///////////////
// GAME GLOBALS
///////////////
namespace Text
{ // Fonts are optional: without one, text is simply not drawn
    TTF_Font* body;
    TTF_Font* big;
    enum class Align { Left, Center };

    void draw(TTF_Font* font, const std::string& s, float x, float y, SDL_Color c, Align a)
    {
        if (  (font == nullptr) || s.empty()  ) return;
        SDL_Surface* surf = TTF_RenderUTF8_Blended(font, s.c_str(), c);
        if (surf == nullptr)
        {
            if (DEBUG) Log::ttf_error(__LINE__);
            return;
        }
        SDL_Texture* t = SDL_CreateTextureFromSurface(ren, surf);
        if (t == nullptr)
        {
            if (DEBUG) Log::sdl_error(__LINE__);
            SDL_FreeSurface(surf);
            return;
        }
        SDL_FRect dst = {
            .x=(a == Align::Center) ? x - surf->w/2.0f : x,
            .y=y,
            .w=static_cast<float>(surf->w),
            .h=static_cast<float>(surf->h)};
        SDL_RenderCopyF(ren, t, NULL, &dst);
        SDL_DestroyTexture(t);
        SDL_FreeSurface(surf);
    }
}

namespace Draw
{ // Shapes SDL_Render does not have
    void set(SDL_Color c) { SDL_SetRenderDrawColor(ren, c.r, c.g, c.b, c.a); }

    void disc(SDL_FPoint center, float radius, SDL_Color c)
    { // Triangle fan over the rational circle
        std::vector<SDL_FPoint> rim = RatCircle::outline(center, radius, 2*RatCircle::N);
        std::vector<SDL_Vertex> v;
        v.reserve(3*rim.size());
        for (size_t i=0; i+1<rim.size(); i++)
        {
            v.push_back(SDL_Vertex{center,   c, SDL_FPoint{0,0}});
            v.push_back(SDL_Vertex{rim[i],   c, SDL_FPoint{0,0}});
            v.push_back(SDL_Vertex{rim[i+1], c, SDL_FPoint{0,0}});
        }
        SDL_RenderGeometry(ren, NULL, v.data(), static_cast<int>(v.size()), NULL, 0);
    }

    void ring(SDL_FPoint center, float radius, SDL_Color c)
    {
        std::vector<SDL_FPoint> rim = RatCircle::outline(center, radius, 4*RatCircle::N);
        set(c);
        SDL_RenderDrawLinesF(ren, rim.data(), static_cast<int>(rim.size()));
    }

    void thick_line(SDL_FPoint a, SDL_FPoint b, float width, SDL_Color c)
    { // A quad around the segment a-b
        float dx = b.x - a.x; float dy = b.y - a.y;
        float len = Geom::length(SDL_FPoint{dx,dy});
        if (len == 0) return;
        float nx = -dy/len*width/2; float ny = dx/len*width/2;
        SDL_Vertex v[4] = {
            {SDL_FPoint{a.x+nx, a.y+ny}, c, SDL_FPoint{0,0}},
            {SDL_FPoint{a.x-nx, a.y-ny}, c, SDL_FPoint{0,0}},
            {SDL_FPoint{b.x-nx, b.y-ny}, c, SDL_FPoint{0,0}},
            {SDL_FPoint{b.x+nx, b.y+ny}, c, SDL_FPoint{0,0}}};
        int idx[6] = {0,1,2, 0,2,3};
        SDL_RenderGeometry(ren, NULL, v, 4, idx, 6);
    }

    void border(SDL_FRect r, int thickness, SDL_Color c)
    {
        set(c);
        for (int i=0; i<thickness; i++)
        {
            SDL_FRect b = {.x=r.x+i, .y=r.y+i, .w=r.w-2*i, .h=r.h-2*i};
            SDL_RenderDrawRectF(ren, &b);
        }
    }

    void fill(SDL_FRect r, SDL_Color c)
    {
        set(c);
        SDL_RenderFillRectF(ren, &r);
    }
}

namespace Pages
{ // One menu, one page per control
    enum { MENU, TILT, COLOR, SLING, ISOTOPE, CIRCLE, BOUNCY, MEMORY, COUNT };

    const char* title[COUNT] = {
        "Unintuitive Volume Controls",
        "Gravity Slider",
        "Color Matcher",
        "Slingshot",
        "Unstable Isotope",
        "Perfect Circle",
        "Bouncy Ball",
        "Memory Match"};
    const char* instructions[COUNT] = {
        "",
        "Drag to tilt the bar. The volume is set by the resting position of the ball.",
        "Recreate the target color using the RGB sliders.",
        "Pull back and let go. The harder you pull, the louder.",
        "Set the volume. It will not stay there for long.",
        "Draw a circle. The rounder it is, the louder.",
        "Fling the ball. Every good bounce turns it up by one.",
        "Match the pairs. Press r for a new board."};

    int current = MENU;
    int volume[COUNT];                                  // Latest value per page, -1 : nothing yet

    Volume::Sink sink(int page)
    {
        return [page](int v) { volume[page] = v; };
    }
}

namespace Layout
{ // Control page geometry, in game art pixels
    constexpr SDL_FRect control = {.x=30, .y=110, .w=900, .h=330};
    constexpr SDL_FRect back = {.x=30, .y=495, .w=220, .h=36};
    constexpr float title_y = 20;
    constexpr float instructions_y = 70;
    constexpr float volume_y = 450;
    // Controls work in their own coordinates, origin at the top-left of `control`
    constexpr SDL_FRect local = {.x=0, .y=0, .w=control.w, .h=control.h};

    SDL_FPoint to_local(SDL_FPoint p) { return SDL_FPoint{p.x - control.x, p.y - control.y}; }
    SDL_FPoint to_art(SDL_FPoint p) { return SDL_FPoint{p.x + control.x, p.y + control.y}; }
    SDL_FRect to_art(SDL_FRect r) { return SDL_FRect{r.x + control.x, r.y + control.y, r.w, r.h}; }
}

namespace Menu
{ // Scrolling column of scrambled tiles
    constexpr float MARGIN = 20;
    constexpr float TITLE_H = 60;
    constexpr float TILE_H = 120;
    constexpr float SPACING = 20;
    constexpr int NPLACEHOLDERS = 24;
    constexpr float SCROLL_STEP = 40;                   // Pixels per mouse wheel notch

    struct Item
    {
        Scramble::Label label;
        SDL_FRect box;                                  // Content coordinates
        bool enabled;
        int page;                                       // Page to open, -1 : not a button
        Clock::Ticker ticker;
    };

    std::vector<Item> items;
    float scroll;
    float content_h;

    void build(unsigned seed)
    {
        items.clear();
        const float W = GameArt::rect.w;
        Scramble::Label title(Pages::title[Pages::MENU], 30, seed);
        items.push_back(Item{
            title,
            SDL_FRect{MARGIN, MARGIN, W-2*MARGIN, TITLE_H},
            false, -1, Clock::Ticker(title.speed_ms)});

        float col_w = (W - 2*MARGIN - SPACING)/2;
        float grid_top = MARGIN + TITLE_H + SPACING;
        int ntiles = (Pages::COUNT-1) + NPLACEHOLDERS;
        for (int i=0; i<ntiles; i++)
        {
            int row = i/2; int col = i%2;
            SDL_FRect box = {
                .x=MARGIN + col*(col_w+SPACING),
                .y=grid_top + row*(TILE_H+SPACING),
                .w=col_w, .h=TILE_H};
            bool is_control = (i < Pages::COUNT-1);
            std::string text = is_control ?
                std::string(Pages::title[i+1]) :
                "Placeholder " + std::to_string(i - (Pages::COUNT-1) + 1);
            Scramble::Label label(text, is_control ? 40 : 60, seed + 1 + i);
            items.push_back(Item{
                label, box, is_control, is_control ? i+1 : -1, Clock::Ticker(label.speed_ms)});
        }
        int nrows = (ntiles+1)/2;
        content_h = grid_top + nrows*(TILE_H+SPACING) + MARGIN;
        scroll = 0;
    }

    void check_visibility(void)
    {
        Visibility::Viewport vp = {.scroll=scroll, .height=static_cast<float>(GameArt::rect.h)};
        for (Item& it : items)
        {
            Visibility::Box box = {.top=it.box.y, .height=it.box.h};
            Visibility::apply(it.label, Visibility::classify(box, it.label.in_view, vp));
        }
    }

    void scroll_by(float dy)
    {
        float max_scroll = content_h - GameArt::rect.h;
        if (max_scroll < 0) max_scroll = 0;
        scroll = Geom::clampf(scroll + dy, 0, max_scroll);
    }

    int page_at(SDL_FPoint p)
    { // Which enabled tile is under the (game art) point
        SDL_FPoint c = {p.x, p.y + scroll};
        for (const Item& it : items)
        {
            if (it.enabled && Geom::contains(it.box, c)) return it.page;
        }
        return -1;
    }
}

namespace Controls
{ // The seven simulators and their clocks
    Tilt::State tilt;
    ColorChase::State color;
    Slingshot::State sling;
    Isotope::State isotope;
    CircleGrader::State circle;
    Bouncy::State bouncy;
    Memory::State memory;

    Clock::Ticker tilt_clock(Tilt::TICK_MS);
    Clock::Ticker color_clock(ColorChase::TICK_MS);
    Clock::Ticker sling_clock(Slingshot::TICK_MS);
    Clock::Ticker isotope_clock(Isotope::TICK_MS);
    Clock::Ticker circle_clock(CircleGrader::TICK_MS);
    Clock::Ticker bouncy_clock(Bouncy::TICK_MS);
    Clock::Ticker memory_clock(Memory::TICK_MS);

    bool pointer_held;                                  // Pointer went down inside the control
    SDL_FPoint last_pos;                                // Latest pointer, control coordinates

    void feed(int page, const Input::Event& e)
    { // One event into one simulator
        switch(page)
        {
            case Pages::TILT:    tilt    = Tilt::step(tilt, e, Pages::sink(page)); break;
            case Pages::COLOR:   color   = ColorChase::step(color, e, Pages::sink(page)); break;
            case Pages::SLING:   sling   = Slingshot::step(sling, e, Pages::sink(page)); break;
            case Pages::ISOTOPE: isotope = Isotope::step(isotope, e, Pages::sink(page)); break;
            case Pages::CIRCLE:  circle  = CircleGrader::step(circle, e, Pages::sink(page)); break;
            case Pages::BOUNCY:  bouncy  = Bouncy::step(bouncy, e, Pages::sink(page)); break;
            case Pages::MEMORY:  memory  = Memory::step(memory, e, Pages::sink(page)); break;
            default: break;
        }
    }

    void release(int page)
    { // End the gesture in progress, at the last place the pointer was seen
        if (!pointer_held) return;
        pointer_held = false;
        feed(page, Input::up(last_pos.x, last_pos.y));
    }

    void run(int page, Clock::Ticker& clock, Uint32 dt_ms)
    {
        int due = clock.advance(dt_ms);
        for (int i=0; i<due; i++) feed(page, Input::tick());
    }
}

void open_page(int page)
{
    if (DEBUG) printf("line %d : open page \"%s\"\n", __LINE__, Pages::title[page]);
    Controls::release(Pages::current);                  // No drag survives leaving its page
    if (page == Pages::COLOR)
    { // Every visit is a fresh challenge
        Controls::color = ColorChase::reset_challenge(Controls::color, Pages::sink(Pages::COLOR));
    }
    if (page == Pages::MENU)
    { // Tiles scrolled out of view came back scrambled
        for (Menu::Item& it : Menu::items) it.ticker.reset();
        Menu::check_visibility();
    }
    Pages::current = page;
}

void shutdown(void)
{
    if (Text::big) TTF_CloseFont(Text::big);
    if (Text::body) TTF_CloseFont(Text::body);
    TTF_Quit();
    if (GameArt::tex) SDL_DestroyTexture(GameArt::tex);
    if (ren) SDL_DestroyRenderer(ren);
    if (win) SDL_DestroyWindow(win);
    SDL_Quit();
}

///////
// MAIN
///////

int main(int argc, char* argv[])
{
    ////////
    // SETUP
    ////////

    unsigned seed = static_cast<unsigned>(std::time(0)); // Seed every RNG from the current time
    WindowInfo wI(argc, argv);
    if (DEBUG) printf("Window info: %d x %d at %d,%d\n", wI.w, wI.h, wI.x, wI.y);
    { // SDL Setup
        if (SDL_Init(SDL_INIT_VIDEO) < 0)
        {
            Log::sdl_error(__LINE__);
            return EXIT_FAILURE;
        }
        win = SDL_CreateWindow(Pages::title[Pages::MENU], wI.x, wI.y, wI.w, wI.h, wI.flags);
        if (win == nullptr)
        {
            Log::sdl_error(__LINE__);
            shutdown();
            return EXIT_FAILURE;
        }
        Uint32 ren_flags = 0;
        ren_flags |= SDL_RENDERER_PRESENTVSYNC;         // 60 fps! No SDL_Delay()
        ren_flags |= SDL_RENDERER_ACCELERATED;          // Hardware acceleration
        ren = SDL_CreateRenderer(win, -1, ren_flags);
        if (ren == nullptr)
        {
            Log::sdl_error(__LINE__);
            shutdown();
            return EXIT_FAILURE;
        }
        SDL_SetRenderDrawBlendMode(ren, SDL_BLENDMODE_BLEND); // Draw with alpha

        // Create a texture for game art
        GameArt::tex = SDL_CreateTexture(ren, SDL_PIXELFORMAT_RGBA8888,
                SDL_TEXTUREACCESS_TARGET,               // Render to this texture
                GameArt::rect.w, GameArt::rect.h);
        if (GameArt::tex == nullptr)
        {
            Log::sdl_error(__LINE__);
            shutdown();
            return EXIT_FAILURE;
        }
        if(SDL_SetTextureBlendMode(GameArt::tex, SDL_BLENDMODE_BLEND) < 0)
        { // Texture blending is not supported
            Log::msg(__LINE__, "Cannot set texture to blendmode blend.");
            shutdown();
            return EXIT_FAILURE;
        }
    }
    { // Font setup
        if (TTF_Init() < 0)
        {
            Log::ttf_error(__LINE__);
            shutdown();
            return EXIT_FAILURE;
        }
        Text::body = TTF_OpenFont(wI.font_path, 20);
        Text::big = TTF_OpenFont(wI.font_path, 30);
        if (  (Text::body == nullptr) || (Text::big == nullptr)  )
        { // Not fatal, the controls still work without words
            Log::ttf_error(__LINE__);
            Log::msg(__LINE__, "No font, running without text. Pass a .ttf as the 5th argument.");
        }
    }

    /////////////////////
    // INITIAL GAME STATE
    /////////////////////

    bool quit = false;                                  // quit : true ends game
    bool is_fullscreen = false;                         // Fullscreen vs windowed
    bool layout_settled{};                              // First visibility check done

    for (int i=0; i<Pages::COUNT; i++) Pages::volume[i] = -1;
    Menu::build(seed);
    Controls::tilt    = Tilt::make(Layout::local);
    Controls::color   = ColorChase::make(Layout::local, seed + 101);
    Controls::sling   = Slingshot::make(Layout::local);
    Controls::isotope = Isotope::make(Layout::local);
    Controls::circle  = CircleGrader::make(Layout::local);
    Controls::bouncy  = Bouncy::make(Layout::local);
    Controls::memory  = Memory::make(Layout::local, seed + 202);
    Controls::pointer_held = false;
    Controls::last_pos = SDL_FPoint{0,0};
    Uint32 last_ms = SDL_GetTicks();

    ////////////
    // GAME LOOP
    ////////////
    while (!quit)
    {
        /////////////////////
        // UI - EVENT HANDLER
        /////////////////////
        SDL_Event e; while(  SDL_PollEvent(&e)  )       // Handle the event queue
        {
            // Quit with default OS stuff
            if (  e.type == SDL_QUIT  ) quit = true;    // Alt-F4 / click X

            // Update window info if user resizes window
            if (  e.type == SDL_WINDOWEVENT  )
            {
                switch(e.window.event)
                {
                    case SDL_WINDOWEVENT_RESIZED:
                        SDL_GetWindowSize(win, &(wI.w), &(wI.h));
                        break;

                    default: break;
                }
            }

            // Keyboard controls
            if (  e.type == SDL_KEYDOWN  )
            {
                switch(e.key.keysym.sym)
                {
                    case SDLK_q: quit = true; break;    // q : quit
                    case SDLK_F11:                      // F11 : toggle fullscreen
                        is_fullscreen = !is_fullscreen;
                        SDL_SetWindowFullscreen(win, is_fullscreen ? SDL_WINDOW_FULLSCREEN_DESKTOP : 0);
                        SDL_GetWindowSize(win, &(wI.w), &(wI.h));
                        break;

                    case SDLK_ESCAPE:                   // Esc, Backspace : back to menu
                    case SDLK_BACKSPACE:
                        if (Pages::current != Pages::MENU) open_page(Pages::MENU);
                        break;

                    case SDLK_r:                        // r : new memory board
                        if (Pages::current == Pages::MEMORY)
                        {
                            Controls::memory = Memory::deal(Controls::memory, Pages::sink(Pages::MEMORY));
                        }
                        break;

                    default: break;
                }
            }

            // Menu scrolling
            if (  (e.type == SDL_MOUSEWHEEL) && (Pages::current == Pages::MENU)  )
            {
                Menu::scroll_by(-e.wheel.y*Menu::SCROLL_STEP);
                Menu::check_visibility();
            }

            // Pointer
            if (  (e.type == SDL_MOUSEBUTTONDOWN) && (e.button.button == SDL_BUTTON_LEFT)  )
            {
                SDL_FPoint p = GtoW::to_game(e.button.x, e.button.y);
                if (DEBUG_UI) printf("line %d : pointer down at %.1f,%.1f\n", __LINE__, p.x, p.y);
                if (Pages::current == Pages::MENU)
                {
                    int page = Menu::page_at(p);
                    if (page > 0) open_page(page);
                }
                else if (Geom::contains(Layout::back, p))
                {
                    open_page(Pages::MENU);
                }
                else if (Geom::contains(Layout::control, p))
                {
                    Controls::pointer_held = true;
                    SDL_FPoint q = Layout::to_local(p);
                    Controls::last_pos = q;
                    Controls::feed(Pages::current, Input::down(q.x, q.y));
                }
            }
            if (  (e.type == SDL_MOUSEMOTION) && Controls::pointer_held  )
            { // Keep following outside the control; simulators clamp
                SDL_FPoint q = Layout::to_local(GtoW::to_game(e.motion.x, e.motion.y));
                Controls::last_pos = q;
                Controls::feed(Pages::current, Input::move(q.x, q.y));
            }
            if (  (e.type == SDL_MOUSEBUTTONUP) && (e.button.button == SDL_BUTTON_LEFT)  )
            {
                if (Controls::pointer_held)
                {
                    Controls::last_pos = Layout::to_local(GtoW::to_game(e.button.x, e.button.y));
                    if (DEBUG_UI) printf("line %d : pointer up at %.1f,%.1f\n", __LINE__, Controls::last_pos.x, Controls::last_pos.y);
                    Controls::release(Pages::current);
                }
            }
        }

        /////////////////
        // PHYSICS UPDATE
        /////////////////
        Uint32 now_ms = SDL_GetTicks();
        Uint32 dt_ms = now_ms - last_ms;
        last_ms = now_ms;

        if (!layout_settled)
        { // First frame: reveal whatever starts out on screen
            Menu::check_visibility();
            layout_settled = true;
        }

        // These two never stop, whichever page is up
        Controls::run(Pages::TILT, Controls::tilt_clock, dt_ms);
        Controls::run(Pages::COLOR, Controls::color_clock, dt_ms);

        switch(Pages::current)
        { // The rest only move while someone is looking
            case Pages::MENU:
                for (Menu::Item& it : Menu::items)
                {
                    int due = it.ticker.advance(dt_ms);
                    for (int i=0; i<due; i++) it.label.tick();
                }
                break;
            case Pages::SLING:   Controls::run(Pages::SLING,   Controls::sling_clock,   dt_ms); break;
            case Pages::ISOTOPE: Controls::run(Pages::ISOTOPE, Controls::isotope_clock, dt_ms); break;
            case Pages::CIRCLE:  Controls::run(Pages::CIRCLE,  Controls::circle_clock,  dt_ms); break;
            case Pages::BOUNCY:  Controls::run(Pages::BOUNCY,  Controls::bouncy_clock,  dt_ms); break;
            case Pages::MEMORY:  Controls::run(Pages::MEMORY,  Controls::memory_clock,  dt_ms); break;
            default: break;
        }

        ////////////
        // RENDERING
        ////////////

        ///////////
        // GAME ART
        ///////////
        SDL_SetRenderTarget(ren, GameArt::tex);
        { // Background color
            Draw::set(Colors::page);
            SDL_RenderClear(ren);
        }

        if (  Pages::current == Pages::MENU  )
        {
            for (size_t i=0; i<Menu::items.size(); i++)
            {
                const Menu::Item& it = Menu::items[i];
                SDL_FRect r = it.box;
                r.y -= Menu::scroll;
                if (  (r.y + r.h < 0) || (r.y > GameArt::rect.h)  ) continue;
                if (i == 0)
                { // Title: big text, underlined
                    Text::draw(Text::big, it.label.text, r.x + r.w/2, r.y + 10, Colors::ink, Text::Align::Center);
                    Draw::fill(SDL_FRect{r.x, r.y + r.h - 4, r.w, 4}, Colors::ink);
                    continue;
                }
                SDL_Color ink = it.enabled ? Colors::ink : Colors::disabled_ink;
                if (!it.enabled) Draw::fill(r, Colors::disabled_fill);
                Draw::border(r, 4, ink);
                Text::draw(Text::body, it.label.text, r.x + 15, r.y + 15, ink, Text::Align::Left);
            }
        }
        else
        {
            const int page = Pages::current;
            Text::draw(Text::big, Pages::title[page], GameArt::rect.w/2.0f, Layout::title_y, Colors::ink, Text::Align::Center);
            Text::draw(Text::body, Pages::instructions[page], GameArt::rect.w/2.0f, Layout::instructions_y, Colors::ink, Text::Align::Center);

            switch(page)
            {
                case Pages::TILT:
                { // Bar through the center, ball on the bar
                    const Tilt::State& s = Controls::tilt;
                    SDL_FPoint c = Layout::to_art(SDL_FPoint{s.bounds.w/2, s.bounds.h/2});
                    float R = 0.4*((s.bounds.w < s.bounds.h) ? s.bounds.w : s.bounds.h);
                    float cx = R*std::cos(s.angle); float cy = R*std::sin(s.angle);
                    Draw::thick_line(SDL_FPoint{c.x+cx, c.y+cy}, SDL_FPoint{c.x-cx, c.y-cy}, 12, Colors::track);
                    Draw::disc(SDL_FPoint{c.x + cx*s.ball_pos, c.y + cy*s.ball_pos}, 15, Colors::tardis);
                    break;
                }
                case Pages::COLOR:
                {
                    const ColorChase::State& s = Controls::color;
                    SDL_FRect ts = Layout::to_art(ColorChase::swatch(s.bounds, true));
                    SDL_FRect cs = Layout::to_art(ColorChase::swatch(s.bounds, false));
                    Draw::fill(ts, s.target);
                    Draw::fill(cs, s.current);
                    Draw::border(ts, 1, Colors::lightgravel);
                    Draw::border(cs, 1, Colors::lightgravel);
                    Text::draw(Text::body, "Chase This Color:", ts.x + 8, ts.y + 8, Colors::contrasts(s.target), Text::Align::Left);
                    Text::draw(Text::body, "Your Color:", cs.x + 8, cs.y + 8, Colors::contrasts(s.current), Text::Align::Left);
                    const Uint8 values[ColorChase::NCHANNELS] = {s.current.r, s.current.g, s.current.b};
                    for (int ch=0; ch<ColorChase::NCHANNELS; ch++)
                    {
                        SDL_FRect t = Layout::to_art(ColorChase::track(s.bounds, ch));
                        Draw::fill(t, Colors::track);
                        float hx = t.x + t.w*values[ch]/255.0f;
                        Draw::disc(SDL_FPoint{hx, t.y + t.h/2}, t.h, Colors::channel[ch]);
                    }
                    break;
                }
                case Pages::SLING:
                {
                    const Slingshot::State& s = Controls::sling;
                    SDL_FPoint a = Layout::to_art(s.anchor);
                    SDL_FPoint left = {a.x - 40, a.y};
                    SDL_FPoint right = {a.x + 40, a.y};
                    Draw::thick_line(left, SDL_FPoint{left.x, a.y + 60}, 6, Colors::deepgravel);
                    Draw::thick_line(right, SDL_FPoint{right.x, a.y + 60}, 6, Colors::deepgravel);
                    if (s.dragging)
                    { // Band stretched through the pouch
                        SDL_FPoint d = Layout::to_art(s.drag);
                        std::vector<SDL_FPoint> band = Dcb::quadratic(left, d, right, 32);
                        Draw::set(Colors::taffy);
                        SDL_RenderDrawLinesF(ren, band.data(), static_cast<int>(band.size()));
                    }
                    else
                    {
                        Draw::thick_line(left, right, 2, Colors::taffy);
                    }
                    Draw::disc(Layout::to_art(s.pos), 10, Colors::orange);
                    break;
                }
                case Pages::ISOTOPE:
                {
                    const Isotope::State& s = Controls::isotope;
                    SDL_FRect t = Layout::to_art(SDL_FRect{0, s.bounds.h/2 - 5, s.bounds.w, 10});
                    Draw::fill(t, Colors::track);
                    Draw::fill(SDL_FRect{t.x, t.y, t.w*s.value/100, t.h}, Colors::lime);
                    Draw::disc(SDL_FPoint{t.x + t.w*s.value/100, t.y + t.h/2}, 12, Colors::handle);
                    break;
                }
                case Pages::CIRCLE:
                {
                    const CircleGrader::State& s = Controls::circle;
                    Draw::border(Layout::to_art(s.bounds), 1, Colors::brightgravel);
                    if (s.stroke.size() > 1)
                    {
                        std::vector<SDL_FPoint> pts;
                        pts.reserve(s.stroke.size());
                        for (SDL_FPoint p : s.stroke) pts.push_back(Layout::to_art(p));
                        Draw::set(Colors::ink);
                        SDL_RenderDrawLinesF(ren, pts.data(), static_cast<int>(pts.size()));
                    }
                    if (  (s.clear_in > 0) && (s.stroke.size() >= CircleGrader::MIN_POINTS)  )
                    { // Show the circle it was graded against
                        CircleGrader::Stats st = CircleGrader::measure(s.stroke);
                        Draw::ring(Layout::to_art(st.centroid), st.mean_radius, Colors::tardis);
                    }
                    break;
                }
                case Pages::BOUNCY:
                {
                    const Bouncy::State& s = Controls::bouncy;
                    Draw::border(Layout::to_art(s.bounds), 2, Colors::ink);
                    Draw::disc(Layout::to_art(s.pos), Bouncy::RADIUS, Colors::taffy);
                    break;
                }
                case Pages::MEMORY:
                {
                    const Memory::State& s = Controls::memory;
                    for (int i=0; i<Memory::NCARDS; i++)
                    {
                        const Memory::Card& card = s.cards[i];
                        SDL_FRect r = Layout::to_art(Memory::cell(s.bounds, i));
                        SDL_Color face = card.matched ? Colors::saltwatertaffy :
                                         (card.face_up ? Colors::snow : Colors::deepgravel);
                        Draw::fill(r, face);
                        Draw::border(r, 2, Colors::ink);
                        if (card.face_up || card.matched)
                        {
                            Text::draw(Text::big, std::string(1, card.symbol), r.x + r.w/2, r.y + r.h/2 - 18,
                                       Colors::contrasts(face), Text::Align::Center);
                        }
                    }
                    break;
                }
                default: break;
            }

            { // Volume readout
                int v = Pages::volume[page];
                std::string s = (v < 0) ? "Volume: --" : "Volume: " + std::to_string(v);
                Text::draw(Text::big, s, GameArt::rect.w/2.0f, Layout::volume_y, Colors::ink, Text::Align::Center);
            }
            { // Back button
                Draw::fill(Layout::back, Colors::plain);
                Draw::border(Layout::back, 2, Colors::brightgravel);
                Text::draw(Text::body, "< Back to Menu", Layout::back.x + 12, Layout::back.y + 6, Colors::ink, Text::Align::Left);
            }
        }

        ////////////
        // OS WINDOW
        ////////////

        SDL_SetRenderTarget(ren, NULL);                 // Render to OS window
        { // Clear the window to a black background
            SDL_SetRenderDrawColor(ren, 0,0,0,0);
            SDL_RenderClear(ren);
        }
        // Copy the game art to the OS window
        SDL_Rect winrect = {.x=0,.y=0,.w=wI.w,.h=wI.h}; // OS window size
        GtoW::dst = GameArt::scale_src_to_win(winrect, GameArt::rect);
        SDL_RenderCopy(ren, GameArt::tex, &GameArt::rect, &GtoW::dst);
        SDL_RenderPresent(ren);
    }

    shutdown();
    return EXIT_SUCCESS;
}
