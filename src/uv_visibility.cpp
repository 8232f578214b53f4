#include "uv_visibility.h"

bool Visibility::center_visible(const Box& box, const Viewport& vp)
{ // Inclusive at both ends
    float center = box.top + box.height/2;
    float bottom = vp.scroll + vp.height;
    return (center >= vp.scroll) && (center <= bottom);
}
bool Visibility::fully_out(const Box& box, const Viewport& vp)
{
    float bottom = vp.scroll + vp.height;
    return (box.top + box.height < vp.scroll) || (box.top > bottom);
}
Visibility::Transition Visibility::classify(const Box& box, bool in_view, const Viewport& vp)
{
    /* *************DOC***************
     * Enter : center moved inside the viewport and the label was not in view
     * Leave : label was in view and is now entirely outside the viewport
     *
     * Leaving needs the whole label gone, entering only needs the center.
     * A label straddling the edge with its center outside stays as it is,
     * so a label sitting on the boundary does not flicker.
     * *******************************/
    bool visible = center_visible(box, vp);
    if (visible && !in_view) return Transition::Enter;
    if (!visible && in_view && fully_out(box, vp)) return Transition::Leave;
    return Transition::None;
}
void Visibility::apply(Scramble::Label& label, Transition t)
{
    switch(t)
    {
        case Transition::Enter:
            label.in_view = true;
            label.start_decryption();
            break;
        case Transition::Leave:
            label.in_view = false;
            label.reset_scramble();
            break;
        default: break;
    }
}
