#include "controls.h"

Delta deltaOf(Direction d)
{
    switch (d)
    {
    case Direction::Up:
        return {-1, 0};
    case Direction::Down:
        return {1, 0};
    case Direction::Left:
        return {0, -1};
    case Direction::Right:
        return {0, 1};
    }
    return {0, 0};
}

ControlToken tokenOf(Direction d)
{
    switch (d)
    {
    case Direction::Up:
        return ControlToken::Up;
    case Direction::Down:
        return ControlToken::Down;
    case Direction::Left:
        return ControlToken::Left;
    case Direction::Right:
        return ControlToken::Right;
    }
    return ControlToken::Right;
}

std::optional<Direction> directionOf(ControlToken t)
{
    switch (t)
    {
    case ControlToken::Up:
        return Direction::Up;
    case ControlToken::Down:
        return Direction::Down;
    case ControlToken::Left:
        return Direction::Left;
    case ControlToken::Right:
        return Direction::Right;
    case ControlToken::Pause:
    case ControlToken::Exit:
        break;
    }
    return std::nullopt;
}

const char *tokenName(ControlToken t)
{
    switch (t)
    {
    case ControlToken::Up:
        return "up";
    case ControlToken::Down:
        return "down";
    case ControlToken::Left:
        return "left";
    case ControlToken::Right:
        return "right";
    case ControlToken::Pause:
        return "pause";
    case ControlToken::Exit:
        return "exit";
    }
    return "?";
}

std::optional<ControlToken> parseToken(std::string_view name)
{
    for (ControlToken t : {ControlToken::Up, ControlToken::Down, ControlToken::Left,
                           ControlToken::Right, ControlToken::Pause, ControlToken::Exit})
    {
        if (name == tokenName(t))
            return t;
    }
    return std::nullopt;
}

KeyMap::KeyMap()
{
    // vi movement keys plus their named equivalents
    table = {
        {"h", ControlToken::Left},
        {"j", ControlToken::Down},
        {"k", ControlToken::Up},
        {"l", ControlToken::Right},
        {"left", ControlToken::Left},
        {"down", ControlToken::Down},
        {"up", ControlToken::Up},
        {"right", ControlToken::Right},
        {"space", ControlToken::Pause},
        {"i", ControlToken::Exit},
        {"esc", ControlToken::Exit},
    };
}

void KeyMap::bind(const std::string &symbol, ControlToken t)
{
    table[symbol] = t;
}

std::optional<ControlToken> KeyMap::lookup(std::string_view symbol) const
{
    auto it = table.find(symbol);
    if (it == table.end())
        return std::nullopt;
    return it->second;
}
