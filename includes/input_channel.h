#pragma once
#include "controls.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string_view>

// Single-slot mailbox holding the latest control token. Its mutex is the one
// lock of the whole game: the loop holds it while it reads the slot and
// commits a tick, so a send() lands either before or after a tick, never in
// the middle of one.
class InputChannel
{
public:
    InputChannel() = default;
    InputChannel(const InputChannel &) = delete;
    InputChannel &operator=(const InputChannel &) = delete;

    // Last write wins; keys pressed between two ticks collapse to the latest
    void send(ControlToken t);

    std::unique_lock<std::mutex> lock() { return std::unique_lock<std::mutex>(mutex); }

    // The following require lock() to be held by the caller
    std::optional<ControlToken> current() const { return slot; }
    void set(std::optional<ControlToken> t) { slot = t; }
    void clear() { slot.reset(); }

    // Waits for a token matching pred, dropping the lock while asleep
    template <typename Pred, typename Rep, typename Period>
    bool waitFor(std::unique_lock<std::mutex> &held,
                 const std::chrono::duration<Rep, Period> &timeout, Pred &&pred)
    {
        return arrived.wait_for(held, timeout, [&]
                                { return pred(slot); });
    }

private:
    std::mutex mutex;
    std::condition_variable arrived;
    std::optional<ControlToken> slot{ControlToken::Right};
};

// Maps a host key symbol to a token and sends it. Unknown symbols are dropped.
// Returns whether the symbol was recognised.
bool onKey(InputChannel &channel, const KeyMap &keys, std::string_view symbol);
