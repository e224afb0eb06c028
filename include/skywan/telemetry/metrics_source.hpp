#pragma once
/**
 * @file metrics_source.hpp
 * @brief Pluggable source of satellite link telemetry.
 * @details A failed or timed-out query is a first-class signal to the decision engine
 *          (unreachability trigger), not merely an error to log.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <string_view>
#include <vector>

#include "skywan/compat/expected.hpp"
#include "skywan/telemetry/link_metrics.hpp"

namespace skywan::telemetry {

    /// @brief Reasons a telemetry query yielded nothing usable.
    enum class SourceErrc : std::uint8_t {
        Unreachable = 1, ///< Command could not be run or exited non-zero
        TimedOut,        ///< Query exceeded its time bound
        Malformed        ///< Response could not be parsed
    };

    struct SourceError {
        SourceErrc  code;
        std::string detail;
    };

    using MetricsResult = skywan_detail::expected<LinkMetrics, SourceError>;

    class MetricsSource {
    public:
        virtual ~MetricsSource() = default;

        /// Query current telemetry. Synchronous and time-bounded.
        virtual MetricsResult query() = 0;
    };

    /**
     * @brief Parse a telemetry JSON object.
     *
     * Keys: `signal`, `latency_ms`, `packet_loss`, `obstruction` (numbers, required) and
     * `seconds_to_next_window` (number, null or absent). Latency is rounded to whole ms.
     */
    MetricsResult parse_link_metrics(std::string_view json, int64_t captured_at);

    /**
     * @class CommandMetricsSource
     * @brief Runs a collector command and parses its stdout with parse_link_metrics().
     */
    class CommandMetricsSource final : public MetricsSource {
    public:
        CommandMetricsSource(std::vector<std::string> argv, std::chrono::milliseconds timeout)
            : argv_(std::move(argv)), timeout_(timeout) {}

        MetricsResult query() override;

    private:
        std::vector<std::string>  argv_;
        std::chrono::milliseconds timeout_;
    };

    const char* to_string(SourceErrc code) noexcept;

} // namespace skywan::telemetry
