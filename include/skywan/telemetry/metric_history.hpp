#pragma once
/**
 * @file metric_history.hpp
 * @brief Bounded ring of recent LinkMetrics used for trend comparison.
 */

#include <cstddef>
#include <deque>
#include <optional>

#include "skywan/telemetry/link_metrics.hpp"

namespace skywan::telemetry {

/**
 * @class MetricHistory
 * @brief Keeps the newest `capacity` samples; the oldest are trimmed on every push.
 */
class MetricHistory {
public:
    explicit MetricHistory(std::size_t capacity) noexcept;

    /// Append a sample and trim to capacity.
    void push(const LinkMetrics& m);

    /// @return Most recent sample, or std::nullopt when empty.
    [[nodiscard]] std::optional<LinkMetrics> latest() const;

    /// Oldest first.
    [[nodiscard]] const std::deque<LinkMetrics>& samples() const noexcept { return samples_; }

    [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }
    [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }

private:
    std::size_t capacity_;
    std::deque<LinkMetrics> samples_;
};

} // namespace skywan::telemetry
