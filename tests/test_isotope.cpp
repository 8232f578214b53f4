#include <vector>
#include <gtest/gtest.h>
#include "uv_isotope.h"

namespace
{
    constexpr SDL_FRect BOUNDS = {.x=0, .y=0, .w=900, .h=330};
}

TEST(Isotope, StartsFull)
{
    Isotope::State s = Isotope::make(BOUNDS);
    EXPECT_FLOAT_EQ(s.value, 100);
    EXPECT_EQ(s.shown, 100);
}

TEST(Isotope, DecaysToZeroOneIntegerAtATime)
{
    Isotope::State s = Isotope::make(BOUNDS);
    std::vector<int> got;
    Volume::Sink sink = [&](int v) { got.push_back(v); };
    s = Isotope::set(s, 50, sink);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], 50);
    got.clear();

    for (int i=0; i<200; i++) s = Isotope::step(s, Input::tick(), sink);
    EXPECT_FLOAT_EQ(s.value, 0);
    ASSERT_EQ(got.size(), 50u);                         // 49, 48, ... 0
    EXPECT_EQ(got.front(), 49);
    EXPECT_EQ(got.back(), 0);
    for (size_t i=1; i<got.size(); i++) EXPECT_EQ(got[i], got[i-1] - 1);

    // Zero stays zero, quietly
    for (int i=0; i<20; i++) s = Isotope::step(s, Input::tick(), sink);
    EXPECT_FLOAT_EQ(s.value, 0);
    EXPECT_EQ(got.size(), 50u);
}

TEST(Isotope, DragSetsTheValueFromX)
{
    Isotope::State s = Isotope::make(BOUNDS);
    std::vector<int> got;
    Volume::Sink sink = [&](int v) { got.push_back(v); };
    s = Isotope::step(s, Input::down(270, 100), sink);
    EXPECT_EQ(got.back(), 30);
    s = Isotope::step(s, Input::move(-50, 100), sink);
    EXPECT_EQ(got.back(), 0);
    s = Isotope::step(s, Input::move(2000, 100), sink);
    EXPECT_EQ(got.back(), 100);
    s = Isotope::step(s, Input::up(2000, 100), sink);
    EXPECT_EQ(got.size(), 3u);
}

TEST(Isotope, MoveWithoutAGrabIsIgnored)
{
    Isotope::State s = Isotope::make(BOUNDS);
    int n = 0;
    s = Isotope::step(s, Input::move(100, 100), [&](int) { n++; });
    EXPECT_EQ(n, 0);
    EXPECT_FLOAT_EQ(s.value, 100);
}

TEST(Isotope, KeepsDecayingWhileHeld)
{
    Isotope::State s = Isotope::make(BOUNDS);
    s = Isotope::step(s, Input::down(900, 100), Volume::Sink());
    for (int i=0; i<4; i++) s = Isotope::step(s, Input::tick(), Volume::Sink());
    EXPECT_FLOAT_EQ(s.value, 99);
    EXPECT_EQ(s.shown, 99);
}

TEST(Isotope, ReleaseEndsTheDrag)
{
    Isotope::State s = Isotope::make(BOUNDS);
    s = Isotope::step(s, Input::down(450, 100), Volume::Sink());
    s = Isotope::step(s, Input::up(450, 100), Volume::Sink());
    EXPECT_FALSE(s.dragging);
    s = Isotope::step(s, Input::move(90, 100), Volume::Sink());
    EXPECT_EQ(s.shown, 50);
}
