#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the failover engine and its collaborators.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          JSON config file in production deployments.
 */

#include <cstdint>

namespace skywan::config::constants {

// =====================
// Interfaces (RUTOS mwan3 naming)
// =====================
inline constexpr const char* DEFAULT_PRIMARY_INTERFACE = "wan";      ///< Satellite uplink
inline constexpr const char* DEFAULT_BACKUP_INTERFACE  = "mob1s1a1"; ///< First cellular modem

// =====================
// Reactive spike thresholds
// Units: milliseconds for latency; fraction (0.0 to 1.0) for loss
// =====================
inline constexpr int32_t  LATENCY_SPIKE_THRESHOLD_MS      = 100;   ///< Immediate failover above this
inline constexpr double   PACKET_LOSS_SPIKE_THRESHOLD     = 0.02;  ///< 2%

// =====================
// Predictive trend thresholds
// =====================
inline constexpr double   SNR_DROP_THRESHOLD              = 0.5;   ///< dB drop between two samples
inline constexpr double   SATELLITE_HANDOFF_THRESHOLD_S   = 0.5;   ///< Seconds to next reacquisition window

// =====================
// Hysteresis / cooldown
// =====================
inline constexpr int64_t  FAILOVER_COOLDOWN_S             = 300;   ///< 5 min between actions
inline constexpr uint32_t REQUIRED_STABILITY_CHECKS       = 3;     ///< Score confirmations before switching
inline constexpr uint32_t FAILBACK_STABILITY_CHECKS       = 120;   ///< Healthy cycles before failback
inline constexpr bool     REACTIVE_BYPASSES_COOLDOWN      = false; ///< Spikes honour cooldown by default

// =====================
// Failback health criteria
// =====================
inline constexpr double   FAILBACK_MAX_PACKET_LOSS        = 0.01;  ///< 1%
inline constexpr int32_t  FAILBACK_MAX_LATENCY_MS         = LATENCY_SPIKE_THRESHOLD_MS;
inline constexpr double   FAILBACK_MAX_OBSTRUCTION        = 0.001; ///< 0.1% of time obstructed

// =====================
// Runtime
// =====================
inline constexpr uint32_t CHECK_INTERVAL_S                = 60;    ///< Monitor loop period
inline constexpr uint32_t COMMAND_TIMEOUT_S               = 10;    ///< Bound on every external call
inline constexpr uint32_t LOCK_TIMEOUT_S                  = 30;    ///< Wait for the state lock
inline constexpr uint32_t METRIC_HISTORY_LENGTH           = 100;   ///< Retained samples
inline constexpr uint32_t STATUS_RECENT_EVENTS            = 10;    ///< Audit rows shown by `status`

// =====================
// Paths
// =====================
inline constexpr const char* DEFAULT_CONFIG_PATH   = "/etc/skywan/config.json";
inline constexpr const char* STATE_FILE_NAME       = "failover_state.dat";
inline constexpr const char* HISTORY_FILE_NAME     = "metric_history.dat";
inline constexpr const char* LOCK_FILE_NAME        = "skywan.lock";
inline constexpr const char* AUDIT_LOG_FILE_NAME   = "failover_history.csv";

} // namespace skywan::config::constants
