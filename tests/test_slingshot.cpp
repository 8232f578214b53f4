#include <vector>
#include <gtest/gtest.h>
#include "uv_slingshot.h"

namespace
{
    constexpr SDL_FRect BOUNDS = {.x=0, .y=0, .w=900, .h=330};
}

TEST(Slingshot, VolumeIsPullbackOverFullPull)
{
    EXPECT_EQ(Slingshot::volume(200), 100);
    EXPECT_EQ(Slingshot::volume(400), 100);
    EXPECT_EQ(Slingshot::volume(50), 25);
    EXPECT_EQ(Slingshot::volume(0), 0);
}

TEST(Slingshot, AnchorSitsTwoThirdsDown)
{
    Slingshot::State s = Slingshot::make(BOUNDS);
    EXPECT_FLOAT_EQ(s.anchor.x, 450);
    EXPECT_FLOAT_EQ(s.anchor.y, 220);
    EXPECT_FALSE(s.dragging);
    EXPECT_FALSE(s.firing);
}

TEST(Slingshot, ReleaseEmitsAndLaunchesOppositeThePull)
{
    Slingshot::State s = Slingshot::make(BOUNDS);
    std::vector<int> got;
    Volume::Sink sink = [&](int v) { got.push_back(v); };

    s = Slingshot::step(s, Input::down(450, 240), sink);
    s = Slingshot::step(s, Input::move(450, 270), sink);
    EXPECT_TRUE(s.dragging);
    EXPECT_TRUE(got.empty());                           // Nothing until let go
    s = Slingshot::step(s, Input::up(450, 270), sink);

    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], 25);
    EXPECT_FALSE(s.dragging);
    EXPECT_TRUE(s.firing);
    EXPECT_FLOAT_EQ(s.vel.x, 0);
    EXPECT_FLOAT_EQ(s.vel.y, -7.5);
    EXPECT_FLOAT_EQ(s.pos.y, 270);
}

TEST(Slingshot, ReleaseWithoutAGrabIsIgnored)
{
    Slingshot::State s = Slingshot::make(BOUNDS);
    int n = 0;
    s = Slingshot::step(s, Input::up(100, 100), [&](int) { n++; });
    EXPECT_EQ(n, 0);
    EXPECT_FALSE(s.firing);
}

TEST(Slingshot, ZeroPullDoesNotLaunch)
{
    Slingshot::State s = Slingshot::make(BOUNDS);
    std::vector<int> got;
    s = Slingshot::step(s, Input::down(450, 220), Volume::Sink());
    s = Slingshot::step(s, Input::up(450, 220), [&](int v) { got.push_back(v); });
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], 0);
    EXPECT_FALSE(s.firing);
    EXPECT_FLOAT_EQ(s.pos.x, s.anchor.x);
    EXPECT_FLOAT_EQ(s.pos.y, s.anchor.y);
}

TEST(Slingshot, GrabbingMidFlightCancelsTheShot)
{
    Slingshot::State s = Slingshot::make(BOUNDS);
    s = Slingshot::step(s, Input::down(300, 300), Volume::Sink());
    s = Slingshot::step(s, Input::up(300, 300), Volume::Sink());
    ASSERT_TRUE(s.firing);
    for (int i=0; i<10; i++) s = Slingshot::step(s, Input::tick(), Volume::Sink());
    s = Slingshot::step(s, Input::down(500, 250), Volume::Sink());
    EXPECT_FALSE(s.firing);
    EXPECT_TRUE(s.dragging);
    EXPECT_FLOAT_EQ(s.pos.x, 500);
    EXPECT_FLOAT_EQ(s.pos.y, 250);
    // Held: ticks do not move it
    s = Slingshot::step(s, Input::tick(), Volume::Sink());
    EXPECT_FLOAT_EQ(s.pos.y, 250);
}

TEST(Slingshot, ProjectileStaysInsideAndComesToRest)
{
    Slingshot::State s = Slingshot::make(BOUNDS);
    s = Slingshot::step(s, Input::down(250, 320), Volume::Sink());
    s = Slingshot::step(s, Input::up(250, 320), Volume::Sink());
    ASSERT_TRUE(s.firing);
    int ticks = 0;
    while (s.firing && (ticks < 200000))
    {
        s = Slingshot::step(s, Input::tick(), Volume::Sink());
        ASSERT_FALSE(s.firing && s.dragging);
        ASSERT_GE(s.pos.x, BOUNDS.x);
        ASSERT_LE(s.pos.x, BOUNDS.x + BOUNDS.w);
        ASSERT_GE(s.pos.y, BOUNDS.y);
        ASSERT_LE(s.pos.y, BOUNDS.y + BOUNDS.h);
        ticks++;
    }
    EXPECT_FALSE(s.firing);
    EXPECT_GE(s.pos.y, BOUNDS.y + BOUNDS.h - Slingshot::FLOOR_SLOP);
}

TEST(Slingshot, ReleaseEndsThePull)
{
    Slingshot::State s = Slingshot::make(BOUNDS);
    s = Slingshot::step(s, Input::down(450, 240), Volume::Sink());
    s = Slingshot::step(s, Input::move(400, 300), Volume::Sink());
    ASSERT_TRUE(s.dragging);
    s = Slingshot::step(s, Input::up(400, 300), Volume::Sink());
    EXPECT_FALSE(s.dragging);
    EXPECT_TRUE(s.firing);
    // Ticks move the shot again once the pull is over
    SDL_FPoint before = s.pos;
    s = Slingshot::step(s, Input::tick(), Volume::Sink());
    EXPECT_NE(s.pos.x, before.x);
}
