/* *************Dependencies***************
 * - Use SDL for talking to the OS:
 *      - get a window and listen for window events
 *      - listen for mouse, wheel and keyboard events
 *      - write to video
 * - Use SDL_ttf for words: menu tiles, page titles, the volume readout
 *      - the font is optional, pass a .ttf as the 5th argument
 *      - no font: everything still works, it just has no words on it
 *
 * The controls in game-libs only borrow SDL's plain structs (SDL_FPoint,
 * SDL_FRect, SDL_Color). They never call into SDL, so the tests run them
 * without a window.
 * *******************************/
/* *************Running it***************
 *
 *      unvol                       resizable window
 *      unvol x y w h               borderless, always-on-top, at x,y size w x h
 *      unvol x y w h font.ttf      same, with a font
 *
 * Keys:
 *      q           quit
 *      F11         toggle fullscreen
 *      Esc / BS    back to the menu
 *      r           new memory board (memory page only)
 * *******************************/
/* *************Pixel Size and Game Resolution***************
 * Everything is drawn on a 960x540 (60*16 x 60*9) texture, then that texture
 * is scaled up by a whole number and centered in the OS window.
 *
 * So the mouse arrives in window pixels and has to go back the other way:
 * GtoW::to_game undoes the offset and the scale. Then each control gets the
 * pointer in its own coordinates, origin at the top-left of the control.
 * *******************************/
/* *************Program Structure***************
 *
 * Each section of the program is in ALL CAPS to make it easy to search for.
 *
 * ```vim
 * nnoremap <leader>1 zM/GAME GLOBALS<CR>zt
 * nnoremap <leader>2 zM/SETUP<CR>zvzt
 * nnoremap <leader>3 zM/INITIAL GAME STATE<CR>zvzt
 * nnoremap <leader>4 zM/UI - EVENT HANDLER<CR>zvzt
 * nnoremap <leader>5 zM/PHYSICS UPDATE<CR>zvzt
 * nnoremap <leader>6 zM/RENDERING<CR>zvzt
 * ```
 *
 * Program structure within the game loop: UI>>>>Physics>>>>Rendering
 *
 * - UI - EVENT HANDLER
 *      - pointer events become Input::Event and go straight to the control
 *        on the current page
 *      - the menu only scrolls and opens pages
 * - PHYSICS UPDATE
 *      - every control has its own Clock::Ticker
 *      - ticks due are fed to the control as Input::tick() events
 * - RENDERING
 *      - reads control state, never writes it
 * *******************************/
/* *************Physics and Graphics***************
 * Video runs at one speed, 60FPS, and that speed is derived from the monitor VSYNC.
 *
 * Each control wants its own physics speed:
 *
 *      tilt bar        16ms
 *      slingshot       16ms
 *      bouncy ball     16ms
 *      isotope         50ms
 *      circle          100ms   (only the countdown that wipes the stroke)
 *      memory          100ms   (only the countdown that hides a mismatch)
 *      color drift     150ms
 *      menu labels     30-60ms per label
 *
 * A Ticker adds up real elapsed time and pays it out in whole ticks. At 60fps
 * a 16ms control gets one tick most frames and two now and then. A 150ms
 * control gets a tick about every ninth frame.
 *
 * A long stall (dragging the window) would owe hundreds of ticks at once.
 * Ticker pays at most Clock::MAX_CATCHUP and forgets the rest.
 * *******************************/
/* *************Controls are state in, state out***************
 *
 *      next = Control::step(state, event, sink)
 *
 * - state : everything the control knows, passed by value
 * - event : PointerDown, PointerMove, PointerUp (with a position) or Tick
 * - sink  : whoever wants the volume, an std::function<void(int)>
 *
 * No timers inside the controls and no globals. A test feeds it a list of
 * events and checks what comes out. The shell feeds it mouse events and
 * ticks from its clocks and writes the volume into a label.
 *
 * Randomness (scrambled letters, color drift, card shuffle) comes from a
 * std::minstd_rand inside the state, so a seed replays the same game.
 * *******************************/
/* *************Drawing circles***************
 * SDL has no SDL_RenderDrawCircle. Balls and rings are drawn from the rational
 * parametrization of the circle (RatCircle):
 *
 *      x(t) = (1-t*t)/(1+t*t)      y(t) = 2*t/(1+t*t)      t = n/d
 *
 * t from 0 to 1 gives a quarter circle. Rotate it a quarter turn three times
 * for the rest. No trig.
 *
 * A ball is a triangle fan over those points, sent to SDL_RenderGeometry.
 *
 * The slingshot band is a 2nd-order dCB curve: the two fork tips are the end
 * points and the pouch is the middle control point.
 * *******************************/
