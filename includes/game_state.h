#pragma once
#include "collision.h"
#include "controls.h"
#include "point.h"
#include <optional>

enum class Phase
{
    Running,
    Paused,
    Ended
};

// Read-only copy handed out for rendering and inspection
struct Snapshot
{
    Snake snake;
    Point food;
    int score{0};
    Direction direction{Direction::Right};
    Direction previousDirection{Direction::Right};
    Phase phase{Phase::Running};
};

// Cells that changed in one committed tick
struct TickDelta
{
    Point head;
    std::optional<Point> vacated; // old tail, when nothing was eaten
    std::optional<Point> food;    // respawned food, when something was eaten
};

// The game model. Not synchronised on its own: the owner holds the shared
// lock around every call.
class GameState
{
public:
    GameState();

    // Back to the starting snake, food, score and direction
    void reset();

    Snapshot snapshot() const;

    TickDelta commit(Snake newSnake, const Point &newFood, int newScore, bool ateFood);

    // No reversal check: turning back into the body is a loss, not an error
    void requestDirection(Direction d);
    void requestPause();
    void requestExit();
    void resume();

    const Snake &snake() const { return body; }
    const Point &food() const { return foodPos; }
    int score() const { return points; }
    Direction direction() const { return dir; }
    Phase phase() const { return currentPhase; }

    // Record the direction the last tick actually moved in
    void rememberDirection() { prevDir = dir; }

private:
    Snake body;
    Point foodPos;
    int points{0};
    Direction dir{Direction::Right};
    Direction prevDir{Direction::Right};
    Phase currentPhase{Phase::Running};
};
