#include <algorithm>
#include <cmath>
#include "uv_circle.h"

CircleGrader::State CircleGrader::make(SDL_FRect bounds)
{
    return State{
        .bounds=bounds,
        .stroke={},
        .drawing=false,
        .clear_in=0,
        .last_score=-1};
}
CircleGrader::Stats CircleGrader::measure(const std::vector<SDL_FPoint>& stroke)
{
    /* *************DOC***************
     * Centroid of the samples, then every sample's distance from it.
     *
     *      mean_radius = sum(r)/N
     *      stddev      = sqrt( sum((r-mean_radius)^2)/N )
     *
     * An empty stroke measures as all zeros.
     * *******************************/
    Stats st{.centroid={0,0}, .mean_radius=0, .stddev=0};
    if (stroke.empty()) return st;
    float N = static_cast<float>(stroke.size());

    double sx = 0; double sy = 0;                       // Summed in double
    for (const SDL_FPoint& p : stroke)
    {
        sx += p.x;
        sy += p.y;
    }
    st.centroid.x = static_cast<float>(sx/stroke.size());
    st.centroid.y = static_cast<float>(sy/stroke.size());

    std::vector<float> radii;
    radii.reserve(stroke.size());
    for (const SDL_FPoint& p : stroke)
    {
        radii.push_back(Geom::length(SDL_FPoint{p.x - st.centroid.x, p.y - st.centroid.y}));
        st.mean_radius += radii.back();
    }
    st.mean_radius /= N;

    float var = 0;
    for (float r : radii) var += (r - st.mean_radius)*(r - st.mean_radius);
    st.stddev = std::sqrt(var/N);
    return st;
}
int CircleGrader::score(const std::vector<SDL_FPoint>& stroke)
{
    if (stroke.empty()) return 0;
    SDL_FPoint first = stroke.front();
    bool one_spot = std::all_of(stroke.begin(), stroke.end(),
            [first](SDL_FPoint p) { return (p.x == first.x) && (p.y == first.y); });
    if (one_spot) return 0;                             // A dot, not a circle
    Stats st = measure(stroke);
    if (st.mean_radius == 0) return 0;
    float perfection = 1 - st.stddev/st.mean_radius;
    return Volume::clamp(static_cast<int>(std::lround(perfection*SCORE_GAIN + SCORE_OFFSET)));
}
CircleGrader::State CircleGrader::step(State s, const Input::Event& e, const Volume::Sink& emit)
{
    switch(e.kind)
    {
        case Input::Kind::PointerDown:
            // New attempt: any finished stroke still on screen goes away now
            s.stroke.clear();
            s.clear_in = 0;
            s.drawing = true;
            s.stroke.push_back(Geom::clamp_to(e.pos, s.bounds));
            return s;
        case Input::Kind::PointerMove:
            if (!s.drawing) return s;
            s.stroke.push_back(Geom::clamp_to(e.pos, s.bounds));
            return s;
        case Input::Kind::PointerUp:
            if (!s.drawing) return s;
            s.drawing = false;
            if (s.stroke.size() < MIN_POINTS)
            { // Too short to be a circle: drop it, say nothing
                s.stroke.clear();
                return s;
            }
            s.last_score = score(s.stroke);
            Volume::emit(emit, s.last_score);
            s.clear_in = CLEAR_TICKS;
            return s;
        case Input::Kind::Tick:
            if (s.clear_in > 0)
            {
                s.clear_in--;
                if (s.clear_in == 0) s.stroke.clear();
            }
            return s;
    }
    return s;
}
