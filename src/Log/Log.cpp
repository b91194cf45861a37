#include "Log/Log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

void logsys::Init(bool verbose)
{
    // stdout is left free for piped exports
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("mazegen", sink);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e][%l] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::debug("Logging started");
}
