#pragma once
/**
 * @file logging.hpp
 * @brief Default spdlog logger setup shared by the CLI and tests.
 */

namespace skywan::obs {

    /// Log line layout: `[2024-01-01 12:00:00] [info] message`.
    inline constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S] [%l] %v";

    /// Configure the default logger (stderr, colour when a tty). Debug level when @p debug.
    void init_logging(bool debug);

} // namespace skywan::obs
