#include "game_state.h"
#include <utility>

namespace
{
    const Snake INITIAL_SNAKE{{4, 10}, {4, 9}, {4, 8}};
    constexpr Point INITIAL_FOOD{10, 20};
}

GameState::GameState()
{
    reset();
}

void GameState::reset()
{
    body = INITIAL_SNAKE;
    foodPos = INITIAL_FOOD;
    points = 0;
    dir = Direction::Right;
    prevDir = Direction::Right;
    currentPhase = Phase::Running;
}

Snapshot GameState::snapshot() const
{
    Snapshot s;
    s.snake = body;
    s.food = foodPos;
    s.score = points;
    s.direction = dir;
    s.previousDirection = prevDir;
    s.phase = currentPhase;
    return s;
}

TickDelta GameState::commit(Snake newSnake, const Point &newFood, int newScore, bool ateFood)
{
    TickDelta delta;
    delta.head = newSnake.front();
    if (ateFood)
        delta.food = newFood;
    else
        delta.vacated = body.back();

    body = std::move(newSnake);
    foodPos = newFood;
    points = newScore;
    return delta;
}

void GameState::requestDirection(Direction d)
{
    dir = d;
}

void GameState::requestPause()
{
    prevDir = dir;
    currentPhase = Phase::Paused;
}

void GameState::requestExit()
{
    currentPhase = Phase::Ended;
}

void GameState::resume()
{
    dir = prevDir;
    currentPhase = Phase::Running;
}
