/**
 * @file test_state_store.cpp
 * @brief Tests for FailoverState persistence, metric history and the state lock.
 *
 * Validates:
 *  - load(save(s)) == s, including the optional recommendation
 *  - Missing or corrupt state falls back to defaults
 *  - Atomic replacement leaves no temp files behind
 *  - History trimming and malformed-row tolerance
 *  - flock exclusion between independent holders
 */

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>

#include "skywan/state/state_lock.hpp"
#include "skywan/state/state_store.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using skywan::state::FailoverState;
using skywan::state::LockErrc;
using skywan::state::StateLock;
using skywan::state::StateStore;
using skywan::state::StoreErrc;
using skywan::state::decode_state;
using skywan::state::encode_state;
using skywan::telemetry::LinkMetrics;
using skywan::telemetry::MetricHistory;
using skywan::testing::TempDir;
using skywan::testing::healthy_sample;
using skywan::testing::read_all;
using skywan::testing::write_all;

namespace fs = std::filesystem;

// --------------------------- FailoverState ---------------------------------

/**
 * @test RoundTrip_Exact
 * @brief Every field survives save and load, with and without a cached recommendation.
 */
TEST(StateStore, RoundTrip_Exact) {
  TempDir dir;
  StateStore store(dir.path(), "wan");

  FailoverState s{.current_primary = "mob1s1a1", .failover_pending = true, .stability_counter = 2,
                  .failback_counter = 17, .last_action_epoch = 1'700'000'123,
                  .last_scorer_recommendation = "wan"};
  ASSERT_TRUE(store.save(s));
  EXPECT_EQ(store.load(), s);

  s.last_scorer_recommendation.reset();
  s.failover_pending = false;
  s.stability_counter = 0;
  ASSERT_TRUE(store.save(s));
  EXPECT_EQ(store.load(), s);

  s.last_scorer_recommendation = "";
  ASSERT_TRUE(store.save(s));
  EXPECT_EQ(store.load(), s);
}

/**
 * @test Missing_File_Gives_Defaults
 */
TEST(StateStore, Missing_File_Gives_Defaults) {
  TempDir dir;
  StateStore store(dir.path() / "nested", "wan");

  const auto s = store.load();
  EXPECT_EQ(s.current_primary, "wan");
  EXPECT_FALSE(s.failover_pending);
  EXPECT_EQ(s.last_action_epoch, 0);
  EXPECT_FALSE(s.last_scorer_recommendation);

  // First save creates the directory.
  ASSERT_TRUE(store.save(s));
  EXPECT_TRUE(fs::exists(store.state_path()));
}

/**
 * @test Corrupt_File_Gives_Defaults
 * @brief Garbage and inconsistent counters are both rejected by the strict loader.
 */
TEST(StateStore, Corrupt_File_Gives_Defaults) {
  TempDir dir;
  StateStore store(dir.path(), "wan");

  write_all(store.state_path(), "this is not a state file\n");
  EXPECT_EQ(store.load(), store.defaults());
  auto strict = store.load_strict();
  ASSERT_FALSE(strict);
  EXPECT_EQ(strict.error().code, StoreErrc::Corrupt);

  write_all(store.state_path(), "current_primary=wan\nfailover_pending=0\nstability_counter=2\n");
  EXPECT_EQ(store.load(), store.defaults());

  write_all(store.state_path(), "current_primary=wan\nlast_action_epoch=soon\n");
  EXPECT_EQ(store.load(), store.defaults());
}

/**
 * @test Decode_Ignores_Unknown_Keys
 */
TEST(StateStore, Decode_Ignores_Unknown_Keys) {
  auto s = decode_state("current_primary=mob1s1a1\nlegacy_flag=1\nlast_action_epoch=42\n");
  ASSERT_TRUE(s);
  EXPECT_EQ(s->current_primary, "mob1s1a1");
  EXPECT_EQ(s->last_action_epoch, 42);
}

/**
 * @test Encode_Rejects_Line_Breaks
 */
TEST(StateStore, Encode_Rejects_Line_Breaks) {
  FailoverState s{.current_primary = "wan\nfailover_pending=1"};
  EXPECT_FALSE(encode_state(s));
}

/**
 * @test Save_Is_Atomic_Replace
 * @brief Overwrites leave exactly the state file; no temp files survive.
 */
TEST(StateStore, Save_Is_Atomic_Replace) {
  TempDir dir;
  StateStore store(dir.path(), "wan");

  for (int i = 0; i < 5; ++i) {
    FailoverState s{.current_primary = "wan", .last_action_epoch = 1000 + i};
    ASSERT_TRUE(store.save(s));
  }
  std::size_t files = 0;
  for (const auto& e : fs::directory_iterator(dir.path())) {
    ++files;
    EXPECT_EQ(e.path().filename().string(), store.state_path().filename().string());
  }
  EXPECT_EQ(files, 1u);
  EXPECT_NE(read_all(store.state_path()).find("last_action_epoch=1004"), std::string::npos);
}

/**
 * @test Reset_Removes_Files
 */
TEST(StateStore, Reset_Removes_Files) {
  TempDir dir;
  StateStore store(dir.path(), "wan");
  ASSERT_TRUE(store.save(FailoverState{.current_primary = "mob1s1a1"}));
  MetricHistory h(10);
  h.push(healthy_sample(1));
  ASSERT_TRUE(store.save_history(h));

  ASSERT_TRUE(store.reset());
  EXPECT_FALSE(fs::exists(store.state_path()));
  EXPECT_FALSE(fs::exists(store.history_path()));
  EXPECT_EQ(store.load().current_primary, "wan");

  EXPECT_TRUE(store.reset()); // nothing left to remove
}

// --------------------------- MetricHistory ---------------------------------

/**
 * @test History_Trims_To_Capacity
 */
TEST(MetricHistory, History_Trims_To_Capacity) {
  MetricHistory h(3);
  EXPECT_FALSE(h.latest());
  for (int i = 1; i <= 5; ++i) h.push(healthy_sample(i));

  ASSERT_EQ(h.size(), 3u);
  EXPECT_EQ(h.samples().front().captured_at, 3);
  EXPECT_EQ(h.latest()->captured_at, 5);
}

/**
 * @test History_Persists_Through_Store
 * @brief Samples, including an unknown window, reload unchanged; capacity applies on load.
 */
TEST(MetricHistory, History_Persists_Through_Store) {
  TempDir dir;
  StateStore store(dir.path(), "wan");

  MetricHistory h(10);
  LinkMetrics a{.signal = 8.25, .latency_ms = 43, .packet_loss = 0.013, .obstruction = 0.0004,
                .seconds_to_next_window = 12.5, .captured_at = 100};
  LinkMetrics b{.signal = 7.1, .latency_ms = 61, .packet_loss = 0.0, .obstruction = 0.0,
                .seconds_to_next_window = std::nullopt, .captured_at = 160};
  h.push(a);
  h.push(b);
  ASSERT_TRUE(store.save_history(h));

  const auto loaded = store.load_history(10);
  ASSERT_EQ(loaded.size(), 2u);
  EXPECT_EQ(loaded.samples()[0], a);
  EXPECT_EQ(loaded.samples()[1], b);

  const auto narrow = store.load_history(1);
  ASSERT_EQ(narrow.size(), 1u);
  EXPECT_EQ(*narrow.latest(), b);
}

/**
 * @test History_Skips_Malformed_Rows
 */
TEST(MetricHistory, History_Skips_Malformed_Rows) {
  TempDir dir;
  StateStore store(dir.path(), "wan");
  write_all(store.history_path(), "100,8.0,40,0,0,\ngarbage\n160,7.0,x,0,0,\n220,6.5,42,0.01,0,30\n");

  const auto h = store.load_history(100);
  ASSERT_EQ(h.size(), 2u);
  EXPECT_EQ(h.samples()[0].captured_at, 100);
  EXPECT_EQ(h.latest()->captured_at, 220);
  EXPECT_EQ(h.latest()->seconds_to_next_window, std::optional<double>(30.0));
}

// --------------------------- StateLock -------------------------------------

/**
 * @test Lock_Excludes_Second_Holder
 * @brief A second acquisition times out until the first holder releases.
 */
TEST(StateLock, Lock_Excludes_Second_Holder) {
  TempDir dir;
  const auto path = dir / "skywan.lock";

  auto first = StateLock::acquire(path, 0ms);
  ASSERT_TRUE(first);
  EXPECT_TRUE(first->held());

  auto second = StateLock::acquire(path, 150ms);
  ASSERT_FALSE(second);
  EXPECT_EQ(second.error().code, LockErrc::TimedOut);

  { const StateLock release = std::move(*first); }

  auto third = StateLock::acquire(path, 0ms);
  EXPECT_TRUE(third);
}

/**
 * @test Lock_Creates_Parent_Directory
 */
TEST(StateLock, Lock_Creates_Parent_Directory) {
  TempDir dir;
  auto lock = StateLock::acquire(dir / "a/b/skywan.lock", 0ms);
  ASSERT_TRUE(lock);
  EXPECT_TRUE(fs::exists(dir / "a/b/skywan.lock"));
}
