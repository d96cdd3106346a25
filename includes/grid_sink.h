#pragma once
#include "event_queue.h"
#include "render_sink.h"
#include "text_grid.h"
#include <mutex>

// RenderSink that keeps the board in a TextGrid and hands notifications to an
// EventQueue. The grid has its own lock, separate from the game lock, because
// the host thread reads it while the game thread writes.
class GridSink : public RenderSink
{
public:
    GridSink(int rows, int cols, EventQueue &queue);

    void applyCellUpdate(const Point &at, std::string_view text) override;
    void resetSurface(const std::vector<std::string> &lines) override;
    void notify(RenderEvent event) override;

    std::vector<std::string> lines() const;

private:
    mutable std::mutex mutex;
    TextGrid grid;
    EventQueue &queue;
};
