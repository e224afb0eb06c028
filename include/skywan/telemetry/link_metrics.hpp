#pragma once
/**
 * @file link_metrics.hpp
 * @brief Link telemetry snapshot consumed by the decision engine.
 */

#include <cstdint>
#include <optional>

namespace skywan::telemetry {

/**
 * @struct LinkMetrics
 * @brief One telemetry sample of the satellite uplink. Produced fresh every cycle.
 */
struct LinkMetrics {
    double                signal{0.0};          ///< Signal quality (SNR, dB)
    int32_t               latency_ms{0};        ///< PoP ping latency, integer-rounded
    double                packet_loss{0.0};     ///< Ping drop rate [0.0, 1.0]
    double                obstruction{0.0};     ///< Fraction of time obstructed [0.0, 1.0]
    std::optional<double> seconds_to_next_window; ///< Until next reacquisition window; absent if unknown
    int64_t               captured_at{0};       ///< Unix epoch seconds

    bool operator==(const LinkMetrics&) const = default;
};

} // namespace skywan::telemetry
