#ifndef __UV_VISIBILITY_H__
#define __UV_VISIBILITY_H__

#include "uv_scramble.h"

namespace Visibility
{ // Decide which menu labels scrolled into view (reveal) or out of view (rescramble)

    struct Viewport
    {
        float scroll;                                   // Content y at the top of the view
        float height;                                   // Visible height
    };

    struct Box
    { // Vertical extent of a label in content coordinates
        float top;
        float height;
    };

    enum class Transition { None, Enter, Leave };

    bool center_visible(const Box& box, const Viewport& vp);
    bool fully_out(const Box& box, const Viewport& vp);
    Transition classify(const Box& box, bool in_view, const Viewport& vp);
    void apply(Scramble::Label& label, Transition t);
}

#endif // __UV_VISIBILITY_H__
