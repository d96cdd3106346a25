#include <iostream>
#include <string>
#include "config.h"
#include "logging.h"
#include "terminal.h"

int main(int argc, char **argv)
{
    std::filesystem::path configPath = defaultConfigPath();
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
        {
            configPath = argv[++i];
        }
        else
        {
            std::cerr << "usage: " << argv[0] << " [--config FILE]\n";
            return 1;
        }
    }

    GameConfig cfg;
    try
    {
        cfg = loadConfig(configPath);
        initLogging(cfg);
    }
    catch (const std::exception &e)
    {
        std::cerr << "ringsnake: " << e.what() << "\n";
        return 1;
    }

    Terminal terminal(cfg);
    return terminal.run();
}
