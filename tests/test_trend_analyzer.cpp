/**
 * @file test_trend_analyzer.cpp
 * @brief Tests for the predictive signal-trend check.
 *
 * Validates:
 *  - Degrading requires both a signal drop and a distant reacquisition window
 *  - Strict comparison direction against both thresholds
 *  - Zero signal / unknown window are treated as insufficient data
 */

#include <gtest/gtest.h>

#include "skywan/telemetry/trend_analyzer.hpp"
#include "test_support.hpp"

using skywan::routing::Thresholds;
using skywan::telemetry::LinkMetrics;
using skywan::telemetry::analyze_trend;
using skywan::testing::healthy_sample;

namespace {

Thresholds trend_thresholds() {
  Thresholds t;
  t.snr_drop = 0.5;
  t.satellite_handoff_s = 5.0;
  return t;
}

LinkMetrics with_window(LinkMetrics m, double seconds) {
  m.seconds_to_next_window = seconds;
  return m;
}

} // namespace

/**
 * @test Drop_And_Distant_Window_Is_Degrading
 * @brief 8.0 to 7.0 dB with the next window 60 s away.
 */
TEST(TrendAnalyzer, Drop_And_Distant_Window_Is_Degrading) {
  const auto prev = healthy_sample(100, 8.0);
  const auto cur = with_window(healthy_sample(160, 7.0), 60.0);

  const auto r = analyze_trend(prev, cur, trend_thresholds());
  EXPECT_TRUE(r.degrading);
  EXPECT_DOUBLE_EQ(r.signal_delta, 1.0);
  EXPECT_NE(r.reason.find("SNR drop"), std::string::npos);
  EXPECT_NE(r.reason.find("handoff delay"), std::string::npos);
}

/**
 * @test Delta_Equal_To_Threshold_Is_Stable
 * @brief The drop must strictly exceed the threshold.
 */
TEST(TrendAnalyzer, Delta_Equal_To_Threshold_Is_Stable) {
  const auto prev = healthy_sample(100, 7.5);
  const auto cur = with_window(healthy_sample(160, 7.0), 60.0);

  const auto r = analyze_trend(prev, cur, trend_thresholds());
  EXPECT_FALSE(r.degrading);
  EXPECT_TRUE(r.reason.empty());
}

/**
 * @test Near_Window_Is_Stable
 * @brief A drop right before reacquisition is a normal handoff.
 */
TEST(TrendAnalyzer, Near_Window_Is_Stable) {
  const auto prev = healthy_sample(100, 8.0);
  EXPECT_FALSE(analyze_trend(prev, with_window(healthy_sample(160, 7.0), 5.0), trend_thresholds()).degrading);
  EXPECT_FALSE(analyze_trend(prev, with_window(healthy_sample(160, 7.0), 1.0), trend_thresholds()).degrading);
}

/**
 * @test Unknown_Window_Is_Stable
 * @brief No reacquisition estimate means insufficient data.
 */
TEST(TrendAnalyzer, Unknown_Window_Is_Stable) {
  const auto r = analyze_trend(healthy_sample(100, 8.0), healthy_sample(160, 6.0), trend_thresholds());
  EXPECT_FALSE(r.degrading);
}

/**
 * @test Zero_Signal_Is_Insufficient_Data
 * @brief A zero reading on either side never triggers.
 */
TEST(TrendAnalyzer, Zero_Signal_Is_Insufficient_Data) {
  EXPECT_FALSE(analyze_trend(healthy_sample(100, 8.0), with_window(healthy_sample(160, 0.0), 60.0),
                             trend_thresholds()).degrading);
  EXPECT_FALSE(analyze_trend(healthy_sample(100, 0.0), with_window(healthy_sample(160, 7.0), 60.0),
                             trend_thresholds()).degrading);
}

/**
 * @test Rising_Signal_Is_Stable
 */
TEST(TrendAnalyzer, Rising_Signal_Is_Stable) {
  const auto r = analyze_trend(healthy_sample(100, 6.0), with_window(healthy_sample(160, 9.0), 60.0),
                               trend_thresholds());
  EXPECT_FALSE(r.degrading);
  EXPECT_DOUBLE_EQ(r.signal_delta, -3.0);
}
