#pragma once
#include "point.h"
#include <string>
#include <string_view>
#include <vector>

enum class RenderEvent
{
    UpdateScreen,
    EndGame
};

// What the game loop needs from whoever draws the board. Called from the
// loop thread, never while the game lock is held.
class RenderSink
{
public:
    virtual ~RenderSink() = default;

    // Write text starting at the given cell
    virtual void applyCellUpdate(const Point &at, std::string_view text) = 0;
    // Drop everything on the surface and show these lines instead
    virtual void resetSurface(const std::vector<std::string> &lines) = 0;
    virtual void notify(RenderEvent event) = 0;
};
