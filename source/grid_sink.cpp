#include "grid_sink.h"

GridSink::GridSink(int rows, int cols, EventQueue &queue)
    : grid(rows, cols), queue(queue)
{
}

void GridSink::applyCellUpdate(const Point &at, std::string_view text)
{
    std::lock_guard<std::mutex> guard(mutex);
    grid.addstr(at.row, at.col, text);
}

void GridSink::resetSurface(const std::vector<std::string> &lines)
{
    std::lock_guard<std::mutex> guard(mutex);
    grid.replace(lines);
}

void GridSink::notify(RenderEvent event)
{
    queue.push(event);
}

std::vector<std::string> GridSink::lines() const
{
    std::lock_guard<std::mutex> guard(mutex);
    return grid.lines();
}
