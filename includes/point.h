#pragma once
#include <cstddef>
#include <functional>

// A board cell. Row 0 is the status line.
struct Point
{
    int row{0};
    int col{0};

    bool operator==(const Point &o) const { return row == o.row && col == o.col; }
    bool operator!=(const Point &o) const { return !(*this == o); }
};

struct PointHash
{
    std::size_t operator()(const Point &p) const noexcept
    {
        return std::hash<int>()(p.row * 1000 + p.col);
    }
};
