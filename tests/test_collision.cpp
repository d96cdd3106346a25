#include <gtest/gtest.h>

#include "board.h"
#include "collision.h"

using namespace std::chrono_literals;

TEST(NextHead, MovesOneCellInDirection)
{
    Snake s{{4, 10}, {4, 9}, {4, 8}};
    EXPECT_EQ(nextHead(s, Direction::Right), (Point{4, 11}));
    EXPECT_EQ(nextHead(s, Direction::Up), (Point{3, 10}));
    EXPECT_EQ(nextHead(s, Direction::Down), (Point{5, 10}));
    EXPECT_EQ(nextHead(s, Direction::Left), (Point{4, 9}));
}

TEST(NextHead, WrapsTopToBottom)
{
    Snake s{{1, 30}};
    EXPECT_EQ(nextHead(s, Direction::Up), (Point{18, 30}));
}

TEST(NextHead, WrapsBottomToTop)
{
    Snake s{{18, 30}};
    EXPECT_EQ(nextHead(s, Direction::Down), (Point{1, 30}));
}

TEST(NextHead, WrapsLeftToRight)
{
    Snake s{{7, 1}};
    EXPECT_EQ(nextHead(s, Direction::Left), (Point{7, 58}));
}

TEST(NextHead, WrapsRightToLeft)
{
    Snake s{{7, 58}};
    EXPECT_EQ(nextHead(s, Direction::Right), (Point{7, 1}));
}

TEST(NextHead, StaysInsidePlayableArea)
{
    Snake s{{LAST_ROW, LAST_COL}};
    for (Direction d : {Direction::Up, Direction::Down, Direction::Left, Direction::Right})
    {
        Point p = nextHead(s, d);
        EXPECT_GE(p.row, FIRST_ROW);
        EXPECT_LE(p.row, LAST_ROW);
        EXPECT_GE(p.col, FIRST_COL);
        EXPECT_LE(p.col, LAST_COL);
    }
}

TEST(SelfCollision, ReversalHitsNeck)
{
    Snake s{{4, 10}, {4, 9}, {4, 8}};
    Point head = nextHead(s, Direction::Left);
    EXPECT_TRUE(isSelfCollision(head, s));
}

TEST(SelfCollision, OldTailCounts)
{
    // Square loop: moving up from (5,10) lands on the tail (4,10)
    Snake s{{5, 10}, {5, 11}, {4, 11}, {4, 10}};
    Point head = nextHead(s, Direction::Up);
    EXPECT_EQ(head, (Point{4, 10}));
    EXPECT_TRUE(isSelfCollision(head, s));
}

TEST(SelfCollision, FreeCellIsSafe)
{
    Snake s{{4, 10}, {4, 9}, {4, 8}};
    EXPECT_FALSE(isSelfCollision({4, 11}, s));
    EXPECT_FALSE(isSelfCollision({5, 10}, s));
}

TEST(AteFood, OnlyOnExactCell)
{
    EXPECT_TRUE(ateFood({10, 20}, {10, 20}));
    EXPECT_FALSE(ateFood({10, 21}, {10, 20}));
    EXPECT_FALSE(ateFood({11, 20}, {10, 20}));
}

TEST(NextFood, LandsInPlayableAreaOffTheSnake)
{
    std::mt19937 rng(7);
    PointSet body{{4, 10}, {4, 9}, {4, 8}};
    for (int i = 0; i < 500; ++i)
    {
        Point f = nextFood(body, rng);
        EXPECT_EQ(body.count(f), 0u);
        EXPECT_GE(f.row, FIRST_ROW);
        EXPECT_LE(f.row, LAST_ROW);
        EXPECT_GE(f.col, FIRST_COL);
        EXPECT_LE(f.col, LAST_COL);
    }
}

TEST(NextFood, FindsTheOnlyFreeCell)
{
    PointSet taken;
    for (int r = FIRST_ROW; r <= LAST_ROW; ++r)
        for (int c = FIRST_COL; c <= LAST_COL; ++c)
            taken.insert({r, c});
    taken.erase({9, 33});

    std::mt19937 rng(1);
    EXPECT_EQ(nextFood(taken, rng), (Point{9, 33}));
}

TEST(TickInterval, MatchesSpeedCurve)
{
    EXPECT_EQ(tickInterval(3), 150ms);
    EXPECT_EQ(tickInterval(50), 135ms);
    EXPECT_EQ(tickInterval(4), 150ms);
    EXPECT_EQ(tickInterval(5), 149ms);
    EXPECT_EQ(tickInterval(9), 149ms);
    EXPECT_EQ(tickInterval(10), 147ms);
}

TEST(TickInterval, WrapsAtModulo)
{
    // 399/5 + 399/10 = 79 + 39 = 118
    EXPECT_EQ(tickInterval(399), 32ms);
    // 400/5 + 400/10 = 120, back to full delay
    EXPECT_EQ(tickInterval(400), 150ms);
    // 799/5 + 799/10 = 159 + 79 = 238, 238 % 120 = 118
    EXPECT_EQ(tickInterval(799), 32ms);
    // 800/5 + 800/10 = 240, back to full delay
    EXPECT_EQ(tickInterval(800), 150ms);
}

TEST(TickInterval, NeverIncreasesBeforeWrap)
{
    auto prev = tickInterval(1);
    for (std::size_t n = 2; n < 400; ++n)
    {
        auto cur = tickInterval(n);
        EXPECT_LE(cur, prev) << "length " << n;
        prev = cur;
    }
}
