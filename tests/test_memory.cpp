#include <map>
#include <random>
#include <vector>
#include <gtest/gtest.h>
#include "uv_memory.h"

namespace
{
    constexpr SDL_FRect BOUNDS = {.x=0, .y=0, .w=900, .h=330};

    int partner(const Memory::State& s, int i)
    {
        for (int j=0; j<Memory::NCARDS; j++)
        {
            if (  (j != i) && (s.cards[j].symbol == s.cards[i].symbol)  ) return j;
        }
        return Memory::NONE;
    }

    int mismatch_for(const Memory::State& s, int i)
    {
        for (int j=0; j<Memory::NCARDS; j++)
        {
            if (s.cards[j].symbol != s.cards[i].symbol) return j;
        }
        return Memory::NONE;
    }
}

TEST(Memory, DealsTwoOfEachSymbol)
{
    Memory::State s = Memory::make(BOUNDS, 42);
    std::map<char, int> count;
    for (const Memory::Card& c : s.cards)
    {
        count[c.symbol]++;
        EXPECT_FALSE(c.face_up);
        EXPECT_FALSE(c.matched);
    }
    ASSERT_EQ(count.size(), 8u);
    for (const auto& kv : count)
    {
        EXPECT_GE(kv.first, 'A');
        EXPECT_LE(kv.first, 'H');
        EXPECT_EQ(kv.second, 2);
    }
}

TEST(Memory, VolumeIsPairsOverEight)
{
    EXPECT_EQ(Memory::volume(0), 0);
    EXPECT_EQ(Memory::volume(1), 13);
    EXPECT_EQ(Memory::volume(4), 50);
    EXPECT_EQ(Memory::volume(8), 100);
}

TEST(Memory, PickingTheSameCardTwiceDoesNothing)
{
    Memory::State s = Memory::make(BOUNDS, 1);
    int n = 0;
    Volume::Sink sink = [&](int) { n++; };
    s = Memory::select(s, 3, sink);
    s = Memory::select(s, 3, sink);
    EXPECT_EQ(s.first, 3);
    EXPECT_EQ(s.second, Memory::NONE);
    EXPECT_EQ(n, 0);
}

TEST(Memory, MatchCountsOnceAndEmits)
{
    Memory::State s = Memory::make(BOUNDS, 1);
    std::vector<int> got;
    Volume::Sink sink = [&](int v) { got.push_back(v); };
    int j = partner(s, 0);
    s = Memory::select(s, 0, sink);
    s = Memory::select(s, j, sink);
    EXPECT_EQ(s.matched_pairs, 1);
    EXPECT_TRUE(s.cards[0].matched);
    EXPECT_TRUE(s.cards[j].matched);
    EXPECT_EQ(s.first, Memory::NONE);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], 13);

    // Matched cards are out of play
    s = Memory::select(s, j, sink);
    EXPECT_EQ(s.first, Memory::NONE);
    EXPECT_EQ(s.matched_pairs, 1);
    EXPECT_EQ(got.size(), 1u);
}

TEST(Memory, MismatchFlipsBackAfterCountdown)
{
    Memory::State s = Memory::make(BOUNDS, 9);
    int n = 0;
    Volume::Sink sink = [&](int) { n++; };
    int j = mismatch_for(s, 0);
    s = Memory::select(s, 0, sink);
    s = Memory::select(s, j, sink);
    EXPECT_EQ(s.hide_in, Memory::HIDE_TICKS);
    EXPECT_TRUE(s.cards[0].face_up);
    EXPECT_TRUE(s.cards[j].face_up);

    // A third pick while two are up is ignored
    int k = partner(s, 0);
    s = Memory::select(s, k, sink);
    EXPECT_FALSE(s.cards[k].face_up);

    for (int i=0; i<Memory::HIDE_TICKS-1; i++) s = Memory::step(s, Input::tick(), sink);
    EXPECT_TRUE(s.cards[0].face_up);
    s = Memory::step(s, Input::tick(), sink);
    EXPECT_FALSE(s.cards[0].face_up);
    EXPECT_FALSE(s.cards[j].face_up);
    EXPECT_EQ(s.first, Memory::NONE);
    EXPECT_EQ(s.second, Memory::NONE);
    EXPECT_EQ(n, 0);
}

TEST(Memory, ClearingTheBoardIsFullVolume)
{
    Memory::State s = Memory::make(BOUNDS, 77);
    std::vector<int> got;
    Volume::Sink sink = [&](int v) { got.push_back(v); };
    for (int i=0; i<Memory::NCARDS; i++)
    {
        if (s.cards[i].matched) continue;
        s = Memory::select(s, i, sink);
        s = Memory::select(s, partner(s, i), sink);
    }
    EXPECT_EQ(s.matched_pairs, Memory::NPAIRS);
    ASSERT_EQ(got.size(), 8u);
    EXPECT_EQ(got.back(), 100);

    s = Memory::deal(s, sink);
    EXPECT_EQ(got.back(), 0);
    EXPECT_EQ(s.matched_pairs, 0);
    for (const Memory::Card& c : s.cards) EXPECT_FALSE(c.matched);
}

TEST(Memory, PointerPicksTheCellUnderIt)
{
    Memory::State s = Memory::make(BOUNDS, 4);
    SDL_FRect c = Memory::cell(BOUNDS, 6);
    s = Memory::step(s, Input::down(c.x + c.w/2, c.y + c.h/2), Volume::Sink());
    EXPECT_EQ(s.first, 6);
    EXPECT_TRUE(s.cards[6].face_up);
    EXPECT_EQ(Memory::cell_at(BOUNDS, SDL_FPoint{-5, -5}), Memory::NONE);
}

TEST(Memory, NeverMoreThanTwoUnmatchedCardsFaceUp)
{
    Memory::State s = Memory::make(BOUNDS, 2024);
    std::minstd_rand rng(7);
    std::uniform_int_distribution<int> pick(0, Memory::NCARDS-1);
    for (int i=0; i<5000; i++)
    {
        s = (i % 3 == 2) ? Memory::step(s, Input::tick(), Volume::Sink())
                         : Memory::select(s, pick(rng), Volume::Sink());
        int up = 0;
        for (const Memory::Card& c : s.cards) if (c.face_up && !c.matched) up++;
        ASSERT_LE(up, 2);
        ASSERT_LE(s.matched_pairs, Memory::NPAIRS);
    }
}
