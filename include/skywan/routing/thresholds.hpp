#pragma once
/**
 * @file thresholds.hpp
 * @brief Decision thresholds shared by the trend analyzer and the decision engine.
 * @details All defaults are named in constants.hpp to avoid magic numbers.
 */

#include <cstdint>
#include "skywan/config/constants.hpp"

namespace skywan::routing {

/** @struct Thresholds
 *  @brief Spike, trend, hysteresis and failback limits. Values are used exactly as configured.
 */
struct Thresholds {
    int32_t  latency_spike_ms{skywan::config::constants::LATENCY_SPIKE_THRESHOLD_MS};     ///< Rule 2 latency ceiling
    double   packet_loss_spike{skywan::config::constants::PACKET_LOSS_SPIKE_THRESHOLD};   ///< Rule 2 loss ceiling
    double   snr_drop{skywan::config::constants::SNR_DROP_THRESHOLD};                     ///< Rule 3 signal delta
    double   satellite_handoff_s{skywan::config::constants::SATELLITE_HANDOFF_THRESHOLD_S}; ///< Rule 3 window distance
    int64_t  failover_cooldown_s{skywan::config::constants::FAILOVER_COOLDOWN_S};         ///< Minimum gap between actions
    uint32_t required_stability_checks{skywan::config::constants::REQUIRED_STABILITY_CHECKS}; ///< Rule 4 confirmations
    uint32_t failback_stability_checks{skywan::config::constants::FAILBACK_STABILITY_CHECKS}; ///< Rule 5 confirmations
    double   failback_max_packet_loss{skywan::config::constants::FAILBACK_MAX_PACKET_LOSS}; ///< Rule 5 health
    int32_t  failback_max_latency_ms{skywan::config::constants::FAILBACK_MAX_LATENCY_MS};  ///< Rule 5 health
    double   failback_max_obstruction{skywan::config::constants::FAILBACK_MAX_OBSTRUCTION}; ///< Rule 5 health
    bool     reactive_bypasses_cooldown{skywan::config::constants::REACTIVE_BYPASSES_COOLDOWN}; ///< Rule 2 ignores cooldown

    bool operator==(const Thresholds&) const = default;
};

} // namespace skywan::routing
