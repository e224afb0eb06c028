/**
 * @file test_config_loader.cpp
 * @brief Tests for JSON configuration loading and validation.
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <string>

#include "skywan/config/config_loader.hpp"
#include "test_support.hpp"

using skywan::config::ConfigErrc;
using skywan::config::EngineConfig;
using skywan::config::Loader;
using skywan::testing::TempDir;
using skywan::testing::write_all;

namespace {

constexpr const char* kMinimal = R"({
  "primary_interface": "wan",
  "backup_interface": "mob1s1a1",
  "state_dir": "/var/lib/skywan",
  "metrics_command": ["/usr/bin/starlink-metrics", "--json"]
})";

} // namespace

/**
 * @test Minimal_Config_Uses_Defaults
 */
TEST(ConfigLoader, Minimal_Config_Uses_Defaults) {
  auto cfg = Loader::load_from_string(kMinimal);
  ASSERT_TRUE(cfg) << cfg.error().detail;

  EXPECT_EQ(cfg->primary_interface, "wan");
  EXPECT_EQ(cfg->backup_interface, "mob1s1a1");
  EXPECT_EQ(cfg->metrics_command.size(), 2u);
  EXPECT_EQ(cfg->audit_log.string(), "/var/lib/skywan/failover_history.csv");
  EXPECT_EQ(cfg->thresholds, skywan::routing::Thresholds{});
  EXPECT_EQ(cfg->check_interval_s, skywan::config::constants::CHECK_INTERVAL_S);
  EXPECT_TRUE(cfg->scorer_command.empty());
  EXPECT_FALSE(cfg->dry_run);

  const auto dc = cfg->decision_config();
  EXPECT_EQ(dc.primary_interface, "wan");
  EXPECT_EQ(dc.thresholds.failback_stability_checks, 120u);
}

/**
 * @test Full_Config_Overrides
 */
TEST(ConfigLoader, Full_Config_Overrides) {
  auto cfg = Loader::load_from_string(R"({
    "primary_interface": "starlink",
    "backup_interface": "lte",
    "state_dir": "/tmp/skywan",
    "audit_log": "/tmp/audit.csv",
    "metrics_command": "/usr/local/bin/dish-metrics",
    "scorer_command": ["/usr/local/bin/score"],
    "route_down_command": ["mwan3", "ifdown"],
    "route_up_command": ["mwan3", "ifup"],
    "notify_command": ["/usr/local/bin/notify"],
    "status_command": ["/usr/local/bin/wan-online"],
    "check_interval_s": 30,
    "command_timeout_s": 5,
    "history_length": 20,
    "dry_run": true,
    "thresholds": {
      "latency_spike_ms": 500,
      "packet_loss_spike": 0.05,
      "snr_drop": 1.5,
      "satellite_handoff_s": 5,
      "failover_cooldown_s": 600,
      "required_stability_checks": 4,
      "failback_stability_checks": 10,
      "reactive_bypasses_cooldown": true
    }
  })");
  ASSERT_TRUE(cfg) << cfg.error().detail;

  EXPECT_EQ(cfg->metrics_command, std::vector<std::string>{"/usr/local/bin/dish-metrics"});
  EXPECT_EQ(cfg->route_up_command, (std::vector<std::string>{"mwan3", "ifup"}));
  EXPECT_EQ(cfg->status_command, std::vector<std::string>{"/usr/local/bin/wan-online"});
  EXPECT_EQ(cfg->audit_log.string(), "/tmp/audit.csv");
  EXPECT_EQ(cfg->check_interval_s, 30u);
  EXPECT_TRUE(cfg->dry_run);
  EXPECT_EQ(cfg->thresholds.latency_spike_ms, 500);
  EXPECT_DOUBLE_EQ(cfg->thresholds.packet_loss_spike, 0.05);
  EXPECT_DOUBLE_EQ(cfg->thresholds.satellite_handoff_s, 5.0);
  EXPECT_EQ(cfg->thresholds.failover_cooldown_s, 600);
  EXPECT_EQ(cfg->thresholds.required_stability_checks, 4u);
  EXPECT_TRUE(cfg->thresholds.reactive_bypasses_cooldown);
  EXPECT_DOUBLE_EQ(cfg->thresholds.failback_max_packet_loss, skywan::config::constants::FAILBACK_MAX_PACKET_LOSS);
}

/**
 * @test Missing_Required_Key
 */
TEST(ConfigLoader, Missing_Required_Key) {
  auto cfg = Loader::load_from_string(R"({"primary_interface":"wan","backup_interface":"lte","state_dir":"/x"})");
  ASSERT_FALSE(cfg);
  EXPECT_EQ(cfg.error().code, ConfigErrc::MissingKey);
  EXPECT_NE(cfg.error().detail.find("metrics_command"), std::string::npos);

  auto blank = Loader::load_from_string(
      R"({"primary_interface":"","backup_interface":"lte","state_dir":"/x","metrics_command":["m"]})");
  ASSERT_FALSE(blank);
  EXPECT_EQ(blank.error().code, ConfigErrc::MissingKey);
}

/**
 * @test Malformed_Json_And_Types
 */
TEST(ConfigLoader, Malformed_Json_And_Types) {
  auto bad = Loader::load_from_string("{ not json");
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code, ConfigErrc::ParseError);

  auto typed = Loader::load_from_string(
      R"({"primary_interface":"wan","backup_interface":"lte","state_dir":"/x","metrics_command":["m"],
          "thresholds":{"snr_drop":"high"}})");
  ASSERT_FALSE(typed);
  EXPECT_EQ(typed.error().code, ConfigErrc::ParseError);

  auto array = Loader::load_from_string("[1,2,3]");
  ASSERT_FALSE(array);
  EXPECT_EQ(array.error().code, ConfigErrc::ParseError);
}

/**
 * @test Validation_Rejects_Out_Of_Range
 */
TEST(ConfigLoader, Validation_Rejects_Out_Of_Range) {
  auto with = [](const std::string& extra) {
    return Loader::load_from_string(
        R"({"primary_interface":"wan","backup_interface":"lte","state_dir":"/x","metrics_command":["m"],)" + extra + "}");
  };

  for (const char* extra : {R"("thresholds":{"packet_loss_spike":1.5})",
                            R"("thresholds":{"required_stability_checks":0})",
                            R"("thresholds":{"snr_drop":-1})",
                            R"("check_interval_s":0)"}) {
    auto cfg = with(extra);
    ASSERT_FALSE(cfg) << extra;
    EXPECT_EQ(cfg.error().code, ConfigErrc::InvalidValue) << extra;
  }

  auto same = Loader::load_from_string(
      R"({"primary_interface":"wan","backup_interface":"wan","state_dir":"/x","metrics_command":["m"]})");
  ASSERT_FALSE(same);
  EXPECT_EQ(same.error().code, ConfigErrc::InvalidValue);
}

/**
 * @test Negative_Counts_Rejected
 * @brief Negative numbers for unsigned fields fail instead of wrapping to huge values.
 */
TEST(ConfigLoader, Negative_Counts_Rejected) {
  for (const char* extra : {R"("thresholds":{"required_stability_checks":-1})",
                            R"("thresholds":{"failback_stability_checks":-120})",
                            R"("check_interval_s":-60)",
                            R"("history_length":-1.5)"}) {
    auto cfg = Loader::load_from_string(
        R"({"primary_interface":"wan","backup_interface":"lte","state_dir":"/x","metrics_command":["m"],)" +
        std::string(extra) + "}");
    ASSERT_FALSE(cfg) << extra;
    EXPECT_EQ(cfg.error().code, ConfigErrc::InvalidValue) << extra;
    EXPECT_NE(cfg.error().detail.find("non-negative"), std::string::npos) << extra;
  }
}

/**
 * @test Load_From_File
 */
TEST(ConfigLoader, Load_From_File) {
  TempDir dir;
  const auto path = (dir / "config.json").string();

  auto missing = Loader::load_from_file(path);
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code, ConfigErrc::NotFound);

  write_all(path, kMinimal);
  auto cfg = Loader::load_from_file(path);
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->state_dir.string(), "/var/lib/skywan");
}

/**
 * @test Environment_Overrides
 */
TEST(ConfigLoader, Environment_Overrides) {
  auto cfg = Loader::load_from_string(kMinimal);
  ASSERT_TRUE(cfg);

  ::setenv("DRY_RUN", "1", 1);
  ::setenv("VERBOSE", "1", 1);
  ::unsetenv("DEBUG");
  Loader::apply_env_overrides(*cfg);
  EXPECT_TRUE(cfg->dry_run);
  EXPECT_TRUE(cfg->debug);

  ::setenv("DRY_RUN", "0", 1);
  Loader::apply_env_overrides(*cfg);
  EXPECT_FALSE(cfg->dry_run);

  ::unsetenv("DRY_RUN");
  ::unsetenv("VERBOSE");
}
