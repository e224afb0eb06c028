/**
 * @file metric_history.cpp
 * @brief MetricHistory ring implementation.
 */
#include "skywan/telemetry/metric_history.hpp"

#include <algorithm>

namespace skywan::telemetry {

MetricHistory::MetricHistory(std::size_t capacity) noexcept
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void MetricHistory::push(const LinkMetrics& m) {
    samples_.push_back(m);
    while (samples_.size() > capacity_) samples_.pop_front();
}

std::optional<LinkMetrics> MetricHistory::latest() const {
    if (samples_.empty()) return std::nullopt;
    return samples_.back();
}

} // namespace skywan::telemetry
