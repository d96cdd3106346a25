#pragma once
#include "controls.h"
#include "point.h"
#include <chrono>
#include <deque>
#include <random>
#include <unordered_set>

// Head first, tail last
using Snake = std::deque<Point>;
using PointSet = std::unordered_set<Point, PointHash>;

// Stateless movement and collision rules. Everything here works on values
// handed in by the caller and touches no shared state.

// Head moved one step in d, wrapped around the board edges
Point nextHead(const Snake &snake, Direction d);

// body is the snake as it was before this tick's move, old tail included
bool isSelfCollision(const Point &newHead, const Snake &body);

bool ateFood(const Point &newHead, const Point &food);

// Uniform draw over the playable area, repeated until it misses excluded.
// Never returns while every cell is excluded.
Point nextFood(const PointSet &excluded, std::mt19937 &rng);

// Delay between ticks for a snake of the given length. Speeds up in steps
// as the snake grows and wraps back after 120ms of speed-up.
std::chrono::milliseconds tickInterval(std::size_t snakeLength);
