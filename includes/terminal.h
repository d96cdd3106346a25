#pragma once
#include "config.h"
#include <string>
#include <vector>

struct notcurses;
struct ncplane;

// Notcurses host for the game. The main thread reads keys and redraws the
// board whenever the game thread posts an event.
class Terminal
{
public:
    explicit Terminal(const GameConfig &cfg);

    // Blocks until the player quits. Returns the process exit status.
    int run();

private:
    void draw(const std::vector<std::string> &lines, bool ended);

    const GameConfig &cfg;
    notcurses *nc{nullptr};
    ncplane *stdp{nullptr};
};
