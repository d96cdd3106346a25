#include "input_channel.h"
#include <spdlog/spdlog.h>

void InputChannel::send(ControlToken t)
{
    {
        std::lock_guard<std::mutex> guard(mutex);
        slot = t;
    }
    arrived.notify_all();
}

bool onKey(InputChannel &channel, const KeyMap &keys, std::string_view symbol)
{
    auto token = keys.lookup(symbol);
    if (!token)
        return false;
    spdlog::trace("[Input] {} -> {}", symbol, tokenName(*token));
    channel.send(*token);
    return true;
}
