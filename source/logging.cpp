#include "logging.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

void initLogging(const GameConfig &cfg)
{
    spdlog::drop("ringsnake");
    std::shared_ptr<spdlog::logger> logger;
    if (cfg.logFile.empty())
        logger = spdlog::null_logger_mt("ringsnake");
    else
        logger = spdlog::basic_logger_mt("ringsnake", cfg.logFile);

    logger->set_level(spdlog::level::from_str(cfg.logLevel));
    logger->flush_on(spdlog::level::info);
    spdlog::set_default_logger(logger);
}
