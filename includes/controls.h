#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>

enum class Direction
{
    Up,
    Down,
    Left,
    Right
};

// What the input side can ask of the game
enum class ControlToken
{
    Up,
    Down,
    Left,
    Right,
    Pause,
    Exit
};

struct Delta
{
    int drow;
    int dcol;
};

Delta deltaOf(Direction d);
ControlToken tokenOf(Direction d);
// Empty for Pause and Exit
std::optional<Direction> directionOf(ControlToken t);

const char *tokenName(ControlToken t);
std::optional<ControlToken> parseToken(std::string_view name);

// Fixed symbol -> token table. Symbols are key names as delivered by the
// host ("h", "left", "space", "esc", ...).
class KeyMap
{
public:
    KeyMap();

    void bind(const std::string &symbol, ControlToken t);
    std::optional<ControlToken> lookup(std::string_view symbol) const;

private:
    std::map<std::string, ControlToken, std::less<>> table;
};
