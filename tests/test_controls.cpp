#include <gtest/gtest.h>

#include "controls.h"

TEST(Controls, DirectionDeltas)
{
    EXPECT_EQ(deltaOf(Direction::Up).drow, -1);
    EXPECT_EQ(deltaOf(Direction::Up).dcol, 0);
    EXPECT_EQ(deltaOf(Direction::Down).drow, 1);
    EXPECT_EQ(deltaOf(Direction::Left).dcol, -1);
    EXPECT_EQ(deltaOf(Direction::Right).dcol, 1);
    EXPECT_EQ(deltaOf(Direction::Right).drow, 0);
}

TEST(Controls, TokensAndDirections)
{
    EXPECT_EQ(directionOf(ControlToken::Up), Direction::Up);
    EXPECT_EQ(directionOf(ControlToken::Right), Direction::Right);
    EXPECT_FALSE(directionOf(ControlToken::Pause).has_value());
    EXPECT_FALSE(directionOf(ControlToken::Exit).has_value());
    EXPECT_EQ(tokenOf(Direction::Left), ControlToken::Left);
}

TEST(Controls, TokenNamesParse)
{
    EXPECT_EQ(parseToken("pause"), ControlToken::Pause);
    EXPECT_EQ(parseToken("exit"), ControlToken::Exit);
    EXPECT_EQ(parseToken(tokenName(ControlToken::Down)), ControlToken::Down);
    EXPECT_FALSE(parseToken("jump").has_value());
    EXPECT_FALSE(parseToken("").has_value());
}

TEST(KeyMap, DefaultTable)
{
    KeyMap keys;
    EXPECT_EQ(keys.lookup("h"), ControlToken::Left);
    EXPECT_EQ(keys.lookup("j"), ControlToken::Down);
    EXPECT_EQ(keys.lookup("k"), ControlToken::Up);
    EXPECT_EQ(keys.lookup("l"), ControlToken::Right);
    EXPECT_EQ(keys.lookup("up"), ControlToken::Up);
    EXPECT_EQ(keys.lookup("space"), ControlToken::Pause);
    EXPECT_EQ(keys.lookup("i"), ControlToken::Exit);
    EXPECT_EQ(keys.lookup("esc"), ControlToken::Exit);
}

TEST(KeyMap, UnknownSymbolsAreNotMapped)
{
    KeyMap keys;
    EXPECT_FALSE(keys.lookup("x").has_value());
    EXPECT_FALSE(keys.lookup("").has_value());
    EXPECT_FALSE(keys.lookup("H").has_value());
}

TEST(KeyMap, BindAddsAndOverrides)
{
    KeyMap keys;
    keys.bind("w", ControlToken::Up);
    keys.bind("i", ControlToken::Pause);
    EXPECT_EQ(keys.lookup("w"), ControlToken::Up);
    EXPECT_EQ(keys.lookup("i"), ControlToken::Pause);
    EXPECT_EQ(keys.lookup("k"), ControlToken::Up);
}
