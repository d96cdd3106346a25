#pragma once
#include "config.h"

// Install the default spdlog logger described by cfg. The terminal belongs to
// the game screen, so output goes to a file or nowhere.
void initLogging(const GameConfig &cfg);
