#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    // Appends to `path`; the "cadence" logger becomes spdlog's default so
    // library code logs through the free spdlog::info/debug/... functions.
    inline void init(const std::string& path = "cadence.log",
        spdlog::level::level_enum level = spdlog::level::debug)
    {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
        auto logger = std::make_shared<spdlog::logger>("cadence", sink);

        logger->set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");
        logger->set_level(level);
        logger->flush_on(spdlog::level::info);

        spdlog::set_default_logger(logger);
    }
}
