/**
 * @file observability.cpp
 * @brief CSV audit log, spdlog mirror and notifier hook.
 */
#include "skywan/obs/observability.hpp"
#include "skywan/os/subprocess.hpp"

#include <charconv>
#include <deque>
#include <fstream>

#include <spdlog/spdlog.h>

namespace skywan::obs {

namespace fs = std::filesystem;

namespace {

bool parse_event_type(std::string_view s, EventType& out) {
    for (auto t : {EventType::Evaluation, EventType::Failover, EventType::Failback, EventType::FailoverFailed}) {
        if (s == to_string(t)) { out = t; return true; }
    }
    return false;
}

bool parse_outcome(std::string_view s, Outcome& out) {
    if (s == "SUCCESS") { out = Outcome::Success; return true; }
    if (s == "FAILED")  { out = Outcome::Failed;  return true; }
    return false;
}

/// Rows are single-line; fold embedded line breaks.
std::string single_line(std::string s) {
    for (auto& c : s) if (c == '\n' || c == '\r') c = ' ';
    return s;
}

} // namespace

const char* to_string(EventType t) noexcept {
    switch (t) {
        case EventType::Evaluation:     return "EVALUATION";
        case EventType::Failover:       return "FAILOVER";
        case EventType::Failback:       return "FAILBACK";
        case EventType::FailoverFailed: return "FAILOVER_FAILED";
    }
    return "UNKNOWN";
}

const char* to_string(Outcome o) noexcept {
    return o == Outcome::Success ? "SUCCESS" : "FAILED";
}

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) return std::string(field);
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::vector<std::string> csv_split(std::string_view row) {
    std::vector<std::string> fields(1);
    bool quoted = false;
    for (std::size_t i = 0; i < row.size(); ++i) {
        const char c = row[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < row.size() && row[i + 1] == '"') { fields.back() += '"'; ++i; }
                else quoted = false;
            } else {
                fields.back() += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.emplace_back();
        } else if (c != '\r') {
            fields.back() += c;
        }
    }
    return fields;
}

skywan_detail::expected<void, AuditError> CsvAuditLog::append(const DecisionEvent& e) {
    std::lock_guard<std::mutex> lk(mu_);

    std::error_code ec;
    if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);
    const bool fresh = !fs::exists(path_, ec) || fs::file_size(path_, ec) == 0;

    std::ofstream out(path_, std::ios::app);
    if (!out) return skywan_detail::unexpected(AuditError{"cannot open " + path_.string()});
    if (fresh) out << kHeader << '\n';
    out << e.timestamp << ','
        << to_string(e.type) << ','
        << csv_escape(single_line(e.from)) << ','
        << csv_escape(single_line(e.to)) << ','
        << to_string(e.outcome) << ','
        << csv_escape(single_line(e.reason)) << '\n';
    out.flush();
    if (!out) return skywan_detail::unexpected(AuditError{"write failed on " + path_.string()});
    return {};
}

void CsvAuditLog::record(const DecisionEvent& e) {
    if (auto r = append(e); !r) spdlog::warn("audit log: {}", r.error().detail);
}

std::vector<DecisionEvent> CsvAuditLog::recent(std::size_t n) const {
    std::ifstream in(path_);
    std::deque<DecisionEvent> tail;
    if (!in || n == 0) return {};

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line == kHeader) continue;
        const auto f = csv_split(line);
        if (f.size() != 6) continue;

        DecisionEvent e;
        const auto [ptr, ec] = std::from_chars(f[0].data(), f[0].data() + f[0].size(), e.timestamp);
        if (ec != std::errc{} || !parse_event_type(f[1], e.type) || !parse_outcome(f[4], e.outcome)) continue;
        e.from = f[2];
        e.to = f[3];
        e.reason = f[5];

        tail.push_back(std::move(e));
        if (tail.size() > n) tail.pop_front();
    }
    return {tail.begin(), tail.end()};
}

void LogSink::record(const DecisionEvent& e) {
    if (e.type == EventType::Evaluation) {
        spdlog::info("{}: {}", to_string(e.type), e.reason);
    } else if (e.outcome == Outcome::Success) {
        spdlog::info("{} {} -> {}: {}", to_string(e.type), e.from, e.to, e.reason);
    } else {
        spdlog::error("{} {} -> {}: {}", to_string(e.type), e.from, e.to, e.reason);
    }
}

void CommandNotifier::record(const DecisionEvent& e) {
    if (argv_.empty() || e.type == EventType::Evaluation) return;

    auto argv = argv_;
    argv.emplace_back(to_string(e.type));
    argv.push_back(e.reason);

    auto run = os::run_command(argv, timeout_);
    if (!run) {
        spdlog::warn("notifier {}: {}", os::to_string(run.error().code), run.error().detail);
    } else if (!run->ok()) {
        spdlog::warn("notifier exited with status {}", run->exit_status);
    }
}

} // namespace skywan::obs
