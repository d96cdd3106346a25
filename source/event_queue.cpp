#include "event_queue.h"

void EventQueue::push(RenderEvent event)
{
    {
        std::lock_guard<std::mutex> guard(mutex);
        events.push_back(event);
    }
    ready.notify_one();
}

std::optional<RenderEvent> EventQueue::pop(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> held(mutex);
    if (!ready.wait_for(held, timeout, [this]
                        { return !events.empty(); }))
        return std::nullopt;
    RenderEvent e = events.front();
    events.pop_front();
    return e;
}

std::size_t EventQueue::size() const
{
    std::lock_guard<std::mutex> guard(mutex);
    return events.size();
}
