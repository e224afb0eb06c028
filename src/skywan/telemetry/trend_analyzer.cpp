/**
 * @file trend_analyzer.cpp
 * @brief Implementation of analyze_trend.
 */
#include "skywan/telemetry/trend_analyzer.hpp"

#include <fmt/format.h>

namespace skywan::telemetry {

TrendResult analyze_trend(const LinkMetrics& previous,
                          const LinkMetrics& current,
                          const routing::Thresholds& th) {
    TrendResult out;

    // 0.0 is what the dish reports when it has no SNR estimate.
    if (previous.signal == 0.0 || current.signal == 0.0) return out;

    out.signal_delta = previous.signal - current.signal;
    if (!(out.signal_delta > th.snr_drop)) return out;
    if (!current.seconds_to_next_window) return out;

    const double window_s = *current.seconds_to_next_window;
    if (!(window_s > th.satellite_handoff_s)) return out;

    out.degrading = true;
    out.reason = fmt::format(
        "SNR drop {:.1f} -> {:.1f} dB (delta {:.1f} > {:g}) + satellite handoff delay ({:g}s > {:g}s)",
        previous.signal, current.signal, out.signal_delta, th.snr_drop,
        window_s, th.satellite_handoff_s);
    return out;
}

} // namespace skywan::telemetry
