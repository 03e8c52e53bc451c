#include "scrubby/logging.hpp"
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace scrubby::logging
{

    void init(bool verbose)
    {
        auto logger = spdlog::get("scrubby");
        if (!logger)
            logger = spdlog::stderr_color_mt("scrubby");
        logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
        spdlog::set_default_logger(std::move(logger));
    }

} // namespace scrubby::logging
