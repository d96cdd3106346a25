#pragma once
#include "render_sink.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// FIFO of render events posted by the game thread and drained by the host
// thread that owns the screen.
class EventQueue
{
public:
    void push(RenderEvent event);

    // Next event, or empty if none arrived within timeout
    std::optional<RenderEvent> pop(std::chrono::milliseconds timeout);

    std::size_t size() const;

private:
    mutable std::mutex mutex;
    std::condition_variable ready;
    std::deque<RenderEvent> events;
};
