#pragma once
#include "board.h"
#include "render_sink.h"
#include "text_grid.h"
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// RenderSink for tests: keeps a grid plus a log of every call
class RecordingSink : public RenderSink
{
public:
    RecordingSink() : grid(BOARD_ROWS, BOARD_COLS) {}

    void applyCellUpdate(const Point &at, std::string_view text) override
    {
        std::lock_guard<std::mutex> guard(mutex);
        grid.addstr(at.row, at.col, text);
        updates.emplace_back(at, std::string(text));
    }

    void resetSurface(const std::vector<std::string> &lines) override
    {
        std::lock_guard<std::mutex> guard(mutex);
        grid.replace(lines);
    }

    void notify(RenderEvent event) override
    {
        std::lock_guard<std::mutex> guard(mutex);
        events.push_back(event);
    }

    std::vector<std::string> lines()
    {
        std::lock_guard<std::mutex> guard(mutex);
        return grid.lines();
    }

    std::vector<RenderEvent> eventLog()
    {
        std::lock_guard<std::mutex> guard(mutex);
        return events;
    }

    std::vector<std::pair<Point, std::string>> takeUpdates()
    {
        std::lock_guard<std::mutex> guard(mutex);
        return std::exchange(updates, {});
    }

private:
    std::mutex mutex;
    TextGrid grid;
    std::vector<std::pair<Point, std::string>> updates;
    std::vector<RenderEvent> events;
};
