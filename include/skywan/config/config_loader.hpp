#pragma once
/**
 * @file config_loader.hpp
 * @brief JSON configuration loader with validation and environment overrides.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "skywan/compat/expected.hpp"
#include "skywan/config/constants.hpp"
#include "skywan/routing/decision_engine.hpp"
#include "skywan/routing/thresholds.hpp"

namespace skywan::config {

    /** @struct EngineConfig
     *  @brief Everything the CLI needs to wire a controller.
     */
    struct EngineConfig {
        std::string              primary_interface{constants::DEFAULT_PRIMARY_INTERFACE}; ///< Satellite uplink
        std::string              backup_interface{constants::DEFAULT_BACKUP_INTERFACE};   ///< Cellular uplink
        std::filesystem::path    state_dir;           ///< State, history and lock files
        std::filesystem::path    audit_log;           ///< CSV audit trail
        std::vector<std::string> metrics_command;     ///< Telemetry collector argv
        std::vector<std::string> scorer_command;      ///< Optional scorer argv
        std::vector<std::string> route_down_command;  ///< e.g. {"mwan3", "ifdown"}
        std::vector<std::string> route_up_command;    ///< e.g. {"mwan3", "ifup"}
        std::vector<std::string> notify_command;      ///< Optional notifier argv
        std::vector<std::string> status_command;      ///< Optional availability check; exit 0 = usable
        routing::Thresholds      thresholds{};        ///< Decision thresholds
        uint32_t check_interval_s{constants::CHECK_INTERVAL_S};
        uint32_t command_timeout_s{constants::COMMAND_TIMEOUT_S};
        uint32_t lock_timeout_s{constants::LOCK_TIMEOUT_S};
        uint32_t history_length{constants::METRIC_HISTORY_LENGTH};
        bool     dry_run{false}; ///< Evaluate and log, never switch routes
        bool     debug{false};   ///< Debug-level logging

        /// Engine view of this configuration.
        routing::DecisionConfig decision_config() const {
            return routing::DecisionConfig{primary_interface, backup_interface, thresholds};
        }
    };

    enum class ConfigErrc : std::uint8_t {
        NotFound = 1, ///< File missing or unreadable
        ParseError,   ///< Not valid JSON / wrong types
        MissingKey,   ///< Required key absent or empty
        InvalidValue  ///< Value out of range
    };

    struct ConfigError {
        ConfigErrc  code;
        std::string detail;
    };

    using ConfigResult = skywan_detail::expected<EngineConfig, ConfigError>;

    /** @class Loader
     *  @brief Source of engine configuration.
     */
    class Loader {
    public:
        /**
         * @brief Load and validate configuration from a JSON file.
         * @param path File path.
         * @return EngineConfig, or ConfigError describing the first problem found.
         */
        static ConfigResult load_from_file(const std::string& path);

        /// Same as load_from_file() for in-memory JSON.
        static ConfigResult load_from_string(std::string_view json);

        /// Apply DRY_RUN, DEBUG and VERBOSE from the environment.
        static void apply_env_overrides(EngineConfig& cfg);

        /// Range and consistency checks.
        static skywan_detail::expected<void, ConfigError> validate(const EngineConfig& cfg);
    };

    const char* to_string(ConfigErrc code) noexcept;

} // namespace skywan::config
