#pragma once
/**
 * @file version.hpp
 * @brief skywan release identification (`skywan version`, monitor start-up log line).
 */

namespace skywan {

    /// Project semantic version components
    inline constexpr int version_major = 1;
    inline constexpr int version_minor = 0;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "1.0.0")
    inline constexpr const char* version_string = "1.0.0";

} // namespace skywan
