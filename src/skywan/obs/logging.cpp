/**
 * @file logging.cpp
 * @brief init_logging implementation.
 */
#include "skywan/obs/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace skywan::obs {

void init_logging(bool debug) {
    auto logger = spdlog::get("skywan");
    if (!logger) logger = spdlog::stderr_color_mt("skywan");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern(LOG_PATTERN);
    spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::info);
}

} // namespace skywan::obs
