#pragma once
/**
 * @file trend_analyzer.hpp
 * @brief Predictive degradation check: falling signal plus a distant reacquisition window.
 */

#include <string>

#include "skywan/routing/thresholds.hpp"
#include "skywan/telemetry/link_metrics.hpp"

namespace skywan::telemetry {

/** @struct TrendResult
 *  @brief Outcome of comparing two consecutive samples.
 */
struct TrendResult {
    bool        degrading{false};  ///< True when a pre-emptive failover is warranted
    double      signal_delta{0.0}; ///< previous.signal - current.signal
    std::string reason;            ///< Human-readable explanation (empty when not degrading)
};

/**
 * @brief Pure trend check.
 *
 * Degrading iff `previous.signal - current.signal > th.snr_drop` and
 * `current.seconds_to_next_window > th.satellite_handoff_s`. A zero signal on either side or an
 * unknown window is insufficient data and never degrading.
 */
TrendResult analyze_trend(const LinkMetrics& previous,
                          const LinkMetrics& current,
                          const routing::Thresholds& th);

} // namespace skywan::telemetry
