/**
 * @file state_store.cpp
 * @brief key=value codec, atomic file replacement and the StateStore facade.
 */
#include "skywan/state/state_store.hpp"
#include "skywan/config/constants.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace skywan::state {

namespace fs = std::filesystem;
using namespace skywan::config::constants;

namespace {

StoreError corrupt(std::string detail) { return StoreError{StoreErrc::Corrupt, std::move(detail)}; }

StoreError io_error(const std::string& what, const fs::path& p, int err) {
    return StoreError{StoreErrc::Io, fmt::format("{} {}: {}", what, p.string(), std::strerror(err))};
}

template<class T>
bool parse_int(std::string_view v, T& out) {
    const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    return ec == std::errc{} && ptr == v.data() + v.size();
}

bool parse_double(std::string_view v, double& out) {
    const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    return ec == std::errc{} && ptr == v.data() + v.size();
}

StoreResult<std::string> read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return skywan_detail::unexpected(io_error("open", p, errno));
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return skywan_detail::unexpected(io_error("read", p, errno));
    return ss.str();
}

std::string encode_history_row(const telemetry::LinkMetrics& m) {
    return fmt::format("{},{},{},{},{},{}\n", m.captured_at, m.signal, m.latency_ms, m.packet_loss,
                       m.obstruction,
                       m.seconds_to_next_window ? fmt::format("{}", *m.seconds_to_next_window) : "");
}

bool decode_history_row(std::string_view row, telemetry::LinkMetrics& m) {
    std::string_view f[6];
    std::size_t n = 0;
    while (n < 6) {
        const auto comma = row.find(',');
        f[n++] = row.substr(0, comma);
        if (comma == std::string_view::npos) break;
        row.remove_prefix(comma + 1);
    }
    if (n != 6) return false;

    if (!parse_int(f[0], m.captured_at) || !parse_double(f[1], m.signal) ||
        !parse_int(f[2], m.latency_ms) || !parse_double(f[3], m.packet_loss) ||
        !parse_double(f[4], m.obstruction)) {
        return false;
    }
    m.seconds_to_next_window.reset();
    if (!f[5].empty()) {
        double w = 0.0;
        if (!parse_double(f[5], w)) return false;
        m.seconds_to_next_window = w;
    }
    return true;
}

} // namespace

StoreResult<std::string> encode_state(const FailoverState& s) {
    const auto has_newline = [](const std::string& v) { return v.find_first_of("\r\n") != std::string::npos; };
    if (has_newline(s.current_primary) ||
        (s.last_scorer_recommendation && has_newline(*s.last_scorer_recommendation))) {
        return skywan_detail::unexpected(corrupt("interface name contains a line break"));
    }

    std::string out;
    out += fmt::format("current_primary={}\n", s.current_primary);
    out += fmt::format("failover_pending={}\n", s.failover_pending ? 1 : 0);
    out += fmt::format("stability_counter={}\n", s.stability_counter);
    out += fmt::format("failback_counter={}\n", s.failback_counter);
    out += fmt::format("last_action_epoch={}\n", s.last_action_epoch);
    if (s.last_scorer_recommendation) {
        out += fmt::format("last_scorer_recommendation={}\n", *s.last_scorer_recommendation);
    }
    return out;
}

StoreResult<FailoverState> decode_state(std::string_view text) {
    FailoverState s;
    bool have_primary = false;
    std::size_t line_no = 0;

    while (!text.empty()) {
        const auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);
        ++line_no;
        if (line.empty()) continue;

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            return skywan_detail::unexpected(corrupt(fmt::format("line {}: missing '='", line_no)));
        }
        const auto key = line.substr(0, eq);
        const auto val = line.substr(eq + 1);

        bool ok = true;
        if (key == "current_primary") {
            s.current_primary = std::string(val);
            have_primary = !val.empty();
        } else if (key == "failover_pending") {
            ok = (val == "0" || val == "1");
            s.failover_pending = (val == "1");
        } else if (key == "stability_counter") {
            ok = parse_int(val, s.stability_counter);
        } else if (key == "failback_counter") {
            ok = parse_int(val, s.failback_counter);
        } else if (key == "last_action_epoch") {
            ok = parse_int(val, s.last_action_epoch);
        } else if (key == "last_scorer_recommendation") {
            s.last_scorer_recommendation = std::string(val);
        }
        if (!ok) {
            return skywan_detail::unexpected(corrupt(fmt::format("line {}: bad value for {}", line_no, key)));
        }
    }

    if (!have_primary) return skywan_detail::unexpected(corrupt("missing current_primary"));
    if (s.failover_pending != (s.stability_counter > 0)) {
        return skywan_detail::unexpected(corrupt("stability_counter inconsistent with failover_pending"));
    }
    return s;
}

StoreResult<void> write_file_atomic(const fs::path& target, std::string_view content) {
    fs::path tmp = target;
    tmp += fmt::format(".tmp.{}", ::getpid());

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return skywan_detail::unexpected(io_error("create", tmp, errno));

    std::size_t off = 0;
    while (off < content.size()) {
        const ssize_t n = ::write(fd, content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            return skywan_detail::unexpected(io_error("write", tmp, err));
        }
        off += static_cast<std::size_t>(n);
    }
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        return skywan_detail::unexpected(io_error("fsync", tmp, err));
    }
    if (::close(fd) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        return skywan_detail::unexpected(io_error("close", tmp, err));
    }
    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        return skywan_detail::unexpected(io_error("rename", target, err));
    }
    return {};
}

StateStore::StateStore(fs::path dir, std::string default_primary)
    : dir_(std::move(dir)), default_primary_(std::move(default_primary)) {}

fs::path StateStore::state_path() const { return dir_ / STATE_FILE_NAME; }
fs::path StateStore::history_path() const { return dir_ / HISTORY_FILE_NAME; }

FailoverState StateStore::defaults() const {
    FailoverState s;
    s.current_primary = default_primary_;
    return s;
}

StoreResult<void> StateStore::ensure_dir() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return skywan_detail::unexpected(StoreError{StoreErrc::Io,
            fmt::format("create {}: {}", dir_.string(), ec.message())});
    }
    return {};
}

StoreResult<FailoverState> StateStore::load_strict() const {
    auto text = read_file(state_path());
    if (!text) return skywan_detail::unexpected(text.error());
    return decode_state(*text);
}

FailoverState StateStore::load() const {
    std::error_code ec;
    if (!fs::exists(state_path(), ec)) {
        spdlog::debug("no state at {}, starting from defaults", state_path().string());
        return defaults();
    }
    auto s = load_strict();
    if (!s) {
        spdlog::warn("state file {} unreadable ({}), using defaults", state_path().string(), s.error().detail);
        return defaults();
    }
    return *s;
}

StoreResult<void> StateStore::save(const FailoverState& s) const {
    auto text = encode_state(s);
    if (!text) return skywan_detail::unexpected(text.error());
    if (auto d = ensure_dir(); !d) return d;
    return write_file_atomic(state_path(), *text);
}

telemetry::MetricHistory StateStore::load_history(std::size_t capacity) const {
    telemetry::MetricHistory h(capacity);
    std::error_code ec;
    if (!fs::exists(history_path(), ec)) return h;

    auto text = read_file(history_path());
    if (!text) {
        spdlog::warn("metric history unreadable: {}", text.error().detail);
        return h;
    }

    std::string_view rest = *text;
    std::size_t skipped = 0;
    while (!rest.empty()) {
        const auto eol = rest.find('\n');
        const auto row = rest.substr(0, eol);
        rest.remove_prefix(eol == std::string_view::npos ? rest.size() : eol + 1);
        if (row.empty()) continue;

        telemetry::LinkMetrics m;
        if (decode_history_row(row, m)) h.push(m);
        else ++skipped;
    }
    if (skipped) spdlog::warn("skipped {} malformed metric history rows", skipped);
    return h;
}

StoreResult<void> StateStore::save_history(const telemetry::MetricHistory& h) const {
    std::string out;
    for (const auto& m : h.samples()) out += encode_history_row(m);
    if (auto d = ensure_dir(); !d) return d;
    return write_file_atomic(history_path(), out);
}

StoreResult<void> StateStore::reset() const {
    for (const auto& p : {state_path(), history_path()}) {
        std::error_code ec;
        fs::remove(p, ec);
        if (ec) {
            return skywan_detail::unexpected(StoreError{StoreErrc::Io,
                fmt::format("remove {}: {}", p.string(), ec.message())});
        }
    }
    return {};
}

} // namespace skywan::state
