#pragma once
/**
 * @file test_support.hpp
 * @brief Shared fixtures: per-test temporary directory and telemetry builders.
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "skywan/telemetry/link_metrics.hpp"

namespace skywan::testing {

/// mkdtemp-backed directory removed on destruction.
class TempDir {
public:
  TempDir() {
    std::string tmpl = (std::filesystem::temp_directory_path() / "skywan-test-XXXXXX").string();
    if (::mkdtemp(tmpl.data()) == nullptr) throw std::runtime_error("mkdtemp failed");
    path_ = tmpl;
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const noexcept { return path_; }
  std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
  std::filesystem::path path_;
};

inline std::string read_all(const std::filesystem::path& p) {
  std::ifstream in(p);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline void write_all(const std::filesystem::path& p, const std::string& content) {
  std::ofstream out(p, std::ios::trunc);
  out << content;
}

/// Clean satellite sample: no spike, healthy enough to count towards failback.
inline telemetry::LinkMetrics healthy_sample(int64_t at, double signal = 9.0) {
  return telemetry::LinkMetrics{.signal = signal, .latency_ms = 40, .packet_loss = 0.0,
                                .obstruction = 0.0, .seconds_to_next_window = std::nullopt,
                                .captured_at = at};
}

} // namespace skywan::testing
