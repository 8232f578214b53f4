#include <vector>
#include <gtest/gtest.h>
#include "uv_bouncy.h"

namespace
{
    constexpr SDL_FRect BOUNDS = {.x=0, .y=0, .w=400, .h=300};
    constexpr float FLOOR = 300 - Bouncy::RADIUS;

    Bouncy::State run(Bouncy::State s, const Volume::Sink& emit, int max_ticks)
    {
        for (int i=0; (i<max_ticks) && s.animating; i++) s = Bouncy::step(s, Input::tick(), emit);
        return s;
    }
}

TEST(Bouncy, StartsRestingOnTheFloor)
{
    Bouncy::State s = Bouncy::make(BOUNDS);
    EXPECT_FLOAT_EQ(s.pos.x, 200);
    EXPECT_FLOAT_EQ(s.pos.y, FLOOR);
    EXPECT_FALSE(s.animating);
}

TEST(Bouncy, FlingUsesOldestAndNewestSample)
{
    std::deque<SDL_FPoint> h = {{0,0}, {5,5}, {10,0}, {15,5}, {20,-10}};
    SDL_FPoint v = Bouncy::fling(h);
    EXPECT_FLOAT_EQ(v.x, 4);
    EXPECT_FLOAT_EQ(v.y, -2);
    EXPECT_FLOAT_EQ(Bouncy::fling({{3,3}}).x, 0);
}

TEST(Bouncy, OnlyTheLastFiveSamplesCount)
{
    Bouncy::State s = Bouncy::make(BOUNDS);
    s = Bouncy::step(s, Input::down(20, 100), Volume::Sink());
    for (int x=40; x<=200; x+=20) s = Bouncy::step(s, Input::move(x, 100), Volume::Sink());
    EXPECT_EQ(s.history.size(), Bouncy::HISTORY);
    s = Bouncy::step(s, Input::up(220, 100), Volume::Sink());
    // Samples 140..220 survive: (220-140)*0.2
    EXPECT_FLOAT_EQ(s.vel.x, 16);
    EXPECT_FLOAT_EQ(s.vel.y, 0);
    EXPECT_TRUE(s.animating);
}

TEST(Bouncy, GrabResetsAndEmitsZero)
{
    Bouncy::State s = Bouncy::make(BOUNDS);
    s.bounces = 7;
    std::vector<int> got;
    s = Bouncy::step(s, Input::down(-50, 1000), [&](int v) { got.push_back(v); });
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], 0);
    EXPECT_EQ(s.bounces, 0);
    EXPECT_TRUE(s.held);
    // Clamped into the arena
    EXPECT_FLOAT_EQ(s.pos.x, Bouncy::RADIUS);
    EXPECT_FLOAT_EQ(s.pos.y, FLOOR);
}

TEST(Bouncy, HardFlingBouncesThenRests)
{
    Bouncy::State s = Bouncy::make(BOUNDS);
    std::vector<int> got;
    Volume::Sink sink = [&](int v) { got.push_back(v); };
    s = Bouncy::step(s, Input::down(100, 100), sink);
    s = Bouncy::step(s, Input::move(130, 80), sink);
    s = Bouncy::step(s, Input::move(160, 60), sink);
    s = Bouncy::step(s, Input::move(190, 40), sink);
    s = Bouncy::step(s, Input::up(220, 20), sink);
    EXPECT_FLOAT_EQ(s.vel.x, 24);
    EXPECT_FLOAT_EQ(s.vel.y, -16);

    s = run(s, sink, 5000);
    EXPECT_FALSE(s.animating);
    EXPECT_GE(s.bounces, 1);
    EXPECT_FLOAT_EQ(s.pos.y, FLOOR);
    EXPECT_FLOAT_EQ(s.vel.x, 0);
    EXPECT_FLOAT_EQ(s.vel.y, 0);
    ASSERT_GE(got.size(), 2u);
    EXPECT_EQ(got.back(), s.bounces);
    for (size_t i=1; i<got.size(); i++) EXPECT_GT(got[i], got[i-1]);
}

TEST(Bouncy, SoftDropDoesNotCount)
{
    Bouncy::State s = Bouncy::make(BOUNDS);
    std::vector<int> got;
    Volume::Sink sink = [&](int v) { got.push_back(v); };
    s = Bouncy::step(s, Input::down(200, FLOOR-2), sink);
    s = Bouncy::step(s, Input::up(200, FLOOR-2), sink);
    s = run(s, sink, 1000);
    EXPECT_FALSE(s.animating);
    EXPECT_EQ(s.bounces, 0);
    ASSERT_EQ(got.size(), 1u);                          // Only the grab
}

TEST(Bouncy, VolumeStopsAtOneHundred)
{
    Bouncy::State s = Bouncy::make(BOUNDS);
    s.bounces = 150;
    s.animating = true;
    s.pos = SDL_FPoint{200, FLOOR-1};
    s.vel = SDL_FPoint{0, 10};
    std::vector<int> got;
    s = Bouncy::step(s, Input::tick(), [&](int v) { got.push_back(v); });
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], 100);
    EXPECT_EQ(s.bounces, 151);
}

TEST(Bouncy, GrabStopsAFlyingBall)
{
    Bouncy::State s = Bouncy::make(BOUNDS);
    s = Bouncy::step(s, Input::down(100, 100), Volume::Sink());
    s = Bouncy::step(s, Input::move(200, 50), Volume::Sink());
    s = Bouncy::step(s, Input::up(300, 0), Volume::Sink());
    for (int i=0; i<30; i++) s = Bouncy::step(s, Input::tick(), Volume::Sink());
    ASSERT_TRUE(s.animating);
    s = Bouncy::step(s, Input::down(150, 150), Volume::Sink());
    EXPECT_FALSE(s.animating);
    EXPECT_FLOAT_EQ(s.vel.x, 0);
    EXPECT_FLOAT_EQ(s.vel.y, 0);
    s = Bouncy::step(s, Input::tick(), Volume::Sink());
    EXPECT_FLOAT_EQ(s.pos.x, 150);
    EXPECT_FLOAT_EQ(s.pos.y, 150);
}

TEST(Bouncy, ReleaseEndsTheHold)
{
    Bouncy::State s = Bouncy::make(BOUNDS);
    s = Bouncy::step(s, Input::down(100, 100), Volume::Sink());
    s = Bouncy::step(s, Input::move(110, 100), Volume::Sink());
    ASSERT_TRUE(s.held);
    s = Bouncy::step(s, Input::up(110, 100), Volume::Sink());
    EXPECT_FALSE(s.held);
    EXPECT_TRUE(s.animating);
    EXPECT_TRUE(s.history.empty());
    // Moves after the release no longer drag the ball
    s = Bouncy::step(s, Input::move(300, 50), Volume::Sink());
    EXPECT_FLOAT_EQ(s.pos.x, 110);
}
