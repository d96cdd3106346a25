#include "collision.h"
#include "board.h"
#include <algorithm>

Point nextHead(const Snake &snake, Direction d)
{
    Point h = snake.front();
    Delta delta = deltaOf(d);
    h.row += delta.drow;
    h.col += delta.dcol;

    // The board is a torus: leaving one edge re-enters at the opposite one
    if (h.row == 0)
        h.row = LAST_ROW;
    if (h.col == 0)
        h.col = LAST_COL;
    if (h.row == BOARD_ROWS)
        h.row = FIRST_ROW;
    if (h.col == BOARD_COLS)
        h.col = FIRST_COL;
    return h;
}

bool isSelfCollision(const Point &newHead, const Snake &body)
{
    return std::any_of(body.begin(), body.end(), [&](const Point &p)
                       { return p == newHead; });
}

bool ateFood(const Point &newHead, const Point &food)
{
    return newHead == food;
}

Point nextFood(const PointSet &excluded, std::mt19937 &rng)
{
    std::uniform_int_distribution<int> drow(FIRST_ROW, LAST_ROW);
    std::uniform_int_distribution<int> dcol(FIRST_COL, LAST_COL);
    while (true)
    {
        Point candidate{drow(rng), dcol(rng)};
        if (excluded.count(candidate) == 0)
            return candidate;
    }
}

std::chrono::milliseconds tickInterval(std::size_t snakeLength)
{
    // Both divisions truncate before the modulo
    const long n = static_cast<long>(snakeLength);
    const long speedUp = (n / 5 + n / 10) % 120;
    return std::chrono::milliseconds(150 - speedUp);
}
