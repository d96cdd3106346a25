#include "config.h"
#include <array>
#include <cstdlib>
#include <fstream>
#include <limits>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

namespace
{
    constexpr std::array<const char *, 7> LOG_LEVELS{"trace", "debug", "info", "warn", "error", "critical", "off"};

    GameConfig fromTree(const pt::ptree &tree)
    {
        GameConfig cfg;

        cfg.logLevel = tree.get<std::string>("log.level", cfg.logLevel);
        bool known = false;
        for (const char *level : LOG_LEVELS)
            known = known || cfg.logLevel == level;
        if (!known)
            throw ConfigError("unknown log level '" + cfg.logLevel + "'");
        cfg.logFile = tree.get<std::string>("log.file", "");

        // get() with a default swallows conversion errors, so look first
        if (tree.get_child_optional("game.pause_poll_ms"))
        {
            int poll = tree.get<int>("game.pause_poll_ms");
            if (poll < 1 || poll > 1000)
                throw ConfigError("game.pause_poll_ms must be within 1..1000, got " + std::to_string(poll));
            cfg.loop.pausePoll = std::chrono::milliseconds(poll);
        }

        // Read signed so that a negative seed is refused instead of wrapping
        if (tree.get_child_optional("game.seed"))
        {
            long long seed = tree.get<long long>("game.seed");
            if (seed < 0 || seed > static_cast<long long>(std::numeric_limits<unsigned>::max()))
                throw ConfigError("game.seed must be within 0.." + std::to_string(std::numeric_limits<unsigned>::max()) +
                                  ", got " + std::to_string(seed));
            cfg.loop.seed = static_cast<unsigned>(seed);
        }

        if (auto keys = tree.get_child_optional("keys"))
        {
            for (const auto &binding : *keys)
            {
                const std::string name = binding.second.get_value<std::string>();
                auto token = parseToken(name);
                if (!token)
                    throw ConfigError("key '" + binding.first + "' bound to unknown action '" + name + "'");
                cfg.keys.bind(binding.first, *token);
            }
        }
        return cfg;
    }
}

fs::path defaultConfigPath()
{
    fs::path base;
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        base = xdg;
    else if (const char *home = std::getenv("HOME"); home && *home)
        base = fs::path(home) / ".config";
    else
        base = fs::current_path();
    return base / "ringsnake" / "ringsnake.ini";
}

GameConfig parseConfig(std::istream &in)
{
    pt::ptree tree;
    try
    {
        pt::ini_parser::read_ini(in, tree);
        return fromTree(tree);
    }
    catch (const pt::ptree_error &e)
    {
        throw ConfigError(e.what());
    }
}

GameConfig loadConfig(const fs::path &path)
{
    if (!fs::exists(path))
        return GameConfig{};
    std::ifstream in(path);
    if (!in.good())
        throw ConfigError("cannot read " + path.string());
    try
    {
        return parseConfig(in);
    }
    catch (const ConfigError &e)
    {
        throw ConfigError(path.string() + ": " + e.what());
    }
}
