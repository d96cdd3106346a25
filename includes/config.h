#pragma once
#include "controls.h"
#include "game_loop.h"
#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct GameConfig
{
    std::string logLevel{"info"};
    // Empty: logging is discarded
    std::string logFile;
    LoopOptions loop;
    KeyMap keys;
};

// $XDG_CONFIG_HOME/ringsnake/ringsnake.ini, falling back to ~/.config
std::filesystem::path defaultConfigPath();

// Missing file yields the defaults. Throws ConfigError on bad contents.
GameConfig loadConfig(const std::filesystem::path &path);
GameConfig parseConfig(std::istream &in);
