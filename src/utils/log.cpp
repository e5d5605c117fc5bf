#include "sb/log.hpp"

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace sb
{
static spdlog::level::level_enum to_spdlog(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
    }
    return spdlog::level::info;
}

void init_logging(LogLevel level)
{
    auto logger = spdlog::get("subbrute");
    if (!logger) logger = spdlog::stderr_color_mt("subbrute");
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    logger->set_level(to_spdlog(level));
    spdlog::set_default_logger(std::move(logger));
}
} // namespace sb
