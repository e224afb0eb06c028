/**
 * @file metrics_source.cpp
 * @brief JSON telemetry parsing and the subprocess-backed MetricsSource.
 */
#include "skywan/telemetry/metrics_source.hpp"
#include "skywan/os/subprocess.hpp"

#include <chrono>
#include <cmath>
#include <nlohmann/json.hpp>

namespace skywan::telemetry {

namespace {

MetricsResult malformed(std::string detail) {
    return skywan_detail::unexpected(SourceError{SourceErrc::Malformed, std::move(detail)});
}

bool read_number(const nlohmann::json& j, const char* key, double& out) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return false;
    out = it->get<double>();
    return std::isfinite(out);
}

} // namespace

MetricsResult parse_link_metrics(std::string_view text, int64_t captured_at) {
    const auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return malformed("telemetry is not a JSON object");

    LinkMetrics m;
    m.captured_at = captured_at;

    double latency = 0.0;
    if (!read_number(j, "signal", m.signal))           return malformed("missing or non-numeric 'signal'");
    if (!read_number(j, "latency_ms", latency))        return malformed("missing or non-numeric 'latency_ms'");
    if (!read_number(j, "packet_loss", m.packet_loss)) return malformed("missing or non-numeric 'packet_loss'");
    if (!read_number(j, "obstruction", m.obstruction)) return malformed("missing or non-numeric 'obstruction'");

    if (latency < 0.0 || m.packet_loss < 0.0 || m.packet_loss > 1.0 ||
        m.obstruction < 0.0 || m.obstruction > 1.0) {
        return malformed("telemetry value out of range");
    }
    m.latency_ms = static_cast<int32_t>(std::lround(latency));

    const auto win = j.find("seconds_to_next_window");
    if (win != j.end() && !win->is_null()) {
        if (!win->is_number()) return malformed("non-numeric 'seconds_to_next_window'");
        m.seconds_to_next_window = win->get<double>();
    }
    return m;
}

MetricsResult CommandMetricsSource::query() {
    auto run = os::run_command(argv_, timeout_);
    if (!run) {
        const auto code = run.error().code == os::ProcessErrc::TimedOut ? SourceErrc::TimedOut
                                                                         : SourceErrc::Unreachable;
        return skywan_detail::unexpected(SourceError{code, run.error().detail});
    }
    if (!run->ok()) {
        return skywan_detail::unexpected(SourceError{SourceErrc::Unreachable,
            os::describe(argv_) + " exited with status " + std::to_string(run->exit_status)});
    }

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return parse_link_metrics(run->output, static_cast<int64_t>(now));
}

const char* to_string(SourceErrc code) noexcept {
    switch (code) {
        case SourceErrc::Unreachable: return "unreachable";
        case SourceErrc::TimedOut:    return "timed_out";
        case SourceErrc::Malformed:   return "malformed";
    }
    return "unknown";
}

} // namespace skywan::telemetry
