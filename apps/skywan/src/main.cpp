/**
 * @file main.cpp
 * @brief skywan operator CLI: wires configuration to the failover controller.
 *
 * **Commands**
 * - monitor: evaluate every check_interval_s until SIGINT/SIGTERM.
 * - check: one evaluation cycle.
 * - status: persisted state, derived phase, cooldown and recent audit events.
 * - failover <iface>: immediate switch, bypassing cooldown and stability checks.
 * - set-primary <iface>: record the active interface without touching routes.
 * - reset: delete persisted state and metric history.
 *
 * Exit status: 0 success, 1 runtime failure, 2 usage or configuration error.
 */

#include <csignal>
#include <cstdlib>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "skywan/config/config_loader.hpp"
#include "skywan/config/constants.hpp"
#include "skywan/control/controller.hpp"
#include "skywan/control/monitor_loop.hpp"
#include "skywan/obs/logging.hpp"
#include "skywan/obs/observability.hpp"
#include "skywan/version.hpp"

using namespace skywan;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    fmt::print(
        "Usage: skywan [--config <path>] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  monitor              Run the failover loop until interrupted\n"
        "  check                Run a single evaluation cycle\n"
        "  status               Show current state and recent events\n"
        "  failover <iface>     Switch to <iface> now\n"
        "  set-primary <iface>  Record <iface> as primary without switching routes\n"
        "  reset                Delete persisted state and metric history\n"
        "  help                 Show this message\n"
        "  version              Print the version\n"
        "\n"
        "Environment: SKYWAN_CONFIG (default {}), DRY_RUN=1, DEBUG=1, VERBOSE=1\n",
        config::constants::DEFAULT_CONFIG_PATH);
}

/// Collaborators built from configuration; owns everything the controller borrows.
struct Wiring {
    std::unique_ptr<state::StateStore>           store;
    std::unique_ptr<telemetry::MetricsSource>    metrics;
    std::unique_ptr<routing::Scorer>             scorer;
    std::unique_ptr<routing::RouteSwitch>        route_switch;
    std::shared_ptr<obs::CsvAuditLog>            audit_log;
    std::unique_ptr<obs::FanoutSink>             sinks;
    std::unique_ptr<control::FailoverController> controller;
};

Wiring wire(const config::EngineConfig& cfg) {
    const std::chrono::milliseconds timeout = std::chrono::seconds(cfg.command_timeout_s);

    Wiring w;
    w.store = std::make_unique<state::StateStore>(cfg.state_dir, cfg.primary_interface);
    w.metrics = std::make_unique<telemetry::CommandMetricsSource>(cfg.metrics_command, timeout);
    if (!cfg.scorer_command.empty()) {
        w.scorer = std::make_unique<routing::CommandScorer>(cfg.scorer_command, timeout);
    }
    w.route_switch = std::make_unique<routing::CommandRouteSwitch>(cfg.route_down_command,
                                                                   cfg.route_up_command, timeout,
                                                                   cfg.status_command);

    w.audit_log = std::make_shared<obs::CsvAuditLog>(cfg.audit_log);
    w.sinks = std::make_unique<obs::FanoutSink>();
    w.sinks->add(std::make_shared<obs::LogSink>());
    w.sinks->add(w.audit_log);
    if (!cfg.notify_command.empty()) {
        w.sinks->add(std::make_shared<obs::CommandNotifier>(cfg.notify_command, timeout));
    }

    control::ControllerOptions opts;
    opts.lock_path = cfg.state_dir / config::constants::LOCK_FILE_NAME;
    opts.lock_timeout = std::chrono::seconds(cfg.lock_timeout_s);
    opts.history_length = cfg.history_length;
    opts.dry_run = cfg.dry_run;

    w.controller = std::make_unique<control::FailoverController>(
        routing::DecisionEngine(cfg.decision_config()), *w.store, *w.metrics, w.scorer.get(),
        *w.route_switch, *w.sinks, opts);
    return w;
}

bool any_failed(const control::CycleReport& r) {
    for (const auto& e : r.events) {
        if (e.outcome == obs::Outcome::Failed) return true;
    }
    return false;
}

int cmd_check(control::FailoverController& c) {
    auto r = c.run_cycle();
    if (!r) {
        spdlog::error("cycle failed ({}): {}", control::to_string(r.error().code), r.error().detail);
        return kExitFailure;
    }
    fmt::print("{}\n", r->decision.note);
    return any_failed(*r) ? kExitFailure : kExitOk;
}

int cmd_monitor(control::FailoverController& c, const config::EngineConfig& cfg) {
    // Route SIGINT/SIGTERM to a dedicated waiter thread instead of an async handler.
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    control::MonitorLoop loop(std::chrono::seconds(cfg.check_interval_s), [&c] {
        if (auto r = c.run_cycle(); !r) {
            spdlog::error("cycle failed ({}): {}", control::to_string(r.error().code), r.error().detail);
        }
    });

    std::thread waiter([&loop, set] {
        int sig = 0;
        sigwait(&set, &sig);
        spdlog::info("received signal {}, stopping", sig);
        loop.stop();
    });

    spdlog::info("skywan {} monitoring {} (backup {}) every {}s{}", skywan::version_string,
                 cfg.primary_interface, cfg.backup_interface, cfg.check_interval_s,
                 cfg.dry_run ? " [dry-run]" : "");
    loop.run();
    waiter.join();
    spdlog::info("monitor stopped after {} cycles", loop.ticks());
    return kExitOk;
}

int cmd_status(control::FailoverController& c, const obs::CsvAuditLog& audit) {
    const auto st = c.status();
    const auto& s = st.state;

    fmt::print("current_primary:   {}\n", s.current_primary);
    fmt::print("phase:             {}\n", routing::to_string(st.phase));
    fmt::print("failover_pending:  {}\n", s.failover_pending ? "yes" : "no");
    fmt::print("stability_counter: {}\n", s.stability_counter);
    fmt::print("failback_counter:  {}\n", s.failback_counter);
    fmt::print("last_action_epoch: {}\n", s.last_action_epoch);
    fmt::print("cooldown:          {}\n",
               st.cooldown_remaining_s > 0 ? fmt::format("{}s remaining", st.cooldown_remaining_s) : "inactive");
    fmt::print("last_recommended:  {}\n", s.last_scorer_recommendation.value_or("-"));

    if (auto live = c.live_recommendation(); !live) {
        fmt::print("scorer_now:        not configured\n");
    } else if (!*live) {
        fmt::print("scorer_now:        unavailable ({})\n", live->error().detail);
    } else {
        const auto& rec = **live;
        fmt::print("scorer_now:        {}{}\n", rec.interface,
                   rec.score ? fmt::format(" (score {:g})", *rec.score) : "");
    }

    if (st.last_metrics) {
        const auto& m = *st.last_metrics;
        fmt::print("last_metrics:      signal={} latency={}ms loss={} obstruction={} window={}\n",
                   m.signal, m.latency_ms, m.packet_loss, m.obstruction,
                   m.seconds_to_next_window ? fmt::format("{}s", *m.seconds_to_next_window) : "unknown");
    }

    const auto events = audit.recent(config::constants::STATUS_RECENT_EVENTS);
    fmt::print("\nrecent events ({}):\n", audit.path().string());
    if (events.empty()) fmt::print("  (none)\n");
    for (const auto& e : events) {
        fmt::print("  {} {:<15} {} -> {} [{}] {}\n", e.timestamp, obs::to_string(e.type), e.from, e.to,
                   obs::to_string(e.outcome), e.reason);
    }
    return kExitOk;
}

int cmd_failover(control::FailoverController& c, const std::string& iface) {
    auto r = c.manual_failover(iface);
    if (!r) {
        spdlog::error("failover to {} failed ({}): {}", iface, control::to_string(r.error().code), r.error().detail);
        return r.error().code == control::CycleErrc::InvalidRequest ? kExitUsage : kExitFailure;
    }
    fmt::print("{}\n", r->events.empty() ? r->decision.note : r->events.back().reason);
    return kExitOk;
}

int cmd_set_primary(control::FailoverController& c, const std::string& iface) {
    auto r = c.set_primary(iface);
    if (!r) {
        spdlog::error("set-primary failed ({}): {}", control::to_string(r.error().code), r.error().detail);
        return r.error().code == control::CycleErrc::InvalidRequest ? kExitUsage : kExitFailure;
    }
    fmt::print("primary set to {}\n", r->current_primary);
    return kExitOk;
}

int cmd_reset(control::FailoverController& c) {
    if (auto r = c.reset(); !r) {
        spdlog::error("reset failed: {}", r.error().detail);
        return kExitFailure;
    }
    fmt::print("state reset\n");
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--config" || a == "-c") {
            if (i + 1 >= argc) { fmt::print(stderr, "--config requires a path\n"); return kExitUsage; }
            config_path = argv[++i];
        } else if (a.rfind("--config=", 0) == 0) {
            config_path = a.substr(9);
        } else if (a == "-h" || a == "--help") {
            args.insert(args.begin(), "help");
        } else if (a == "--version") {
            args.insert(args.begin(), "version");
        } else {
            args.push_back(a);
        }
    }

    if (args.empty() || args[0] == "help") {
        print_usage();
        return args.empty() ? kExitUsage : kExitOk;
    }
    const std::string cmd = args[0];
    if (cmd == "version") {
        fmt::print("skywan {}\n", skywan::version_string);
        return kExitOk;
    }

    static const char* const kCommands[] = {"monitor", "check", "status", "failover", "set-primary", "reset"};
    bool known = false;
    for (const char* k : kCommands) known = known || cmd == k;
    if (!known) {
        fmt::print(stderr, "unknown command '{}'\n\n", cmd);
        print_usage();
        return kExitUsage;
    }
    if ((cmd == "failover" || cmd == "set-primary") && args.size() != 2) {
        fmt::print(stderr, "{} requires exactly one interface name\n", cmd);
        return kExitUsage;
    }

    if (config_path.empty()) {
        const char* env = std::getenv("SKYWAN_CONFIG");
        config_path = env && *env ? env : config::constants::DEFAULT_CONFIG_PATH;
    }

    auto cfg = config::Loader::load_from_file(config_path);
    if (!cfg) {
        obs::init_logging(false);
        spdlog::error("configuration error ({}): {}", config::to_string(cfg.error().code), cfg.error().detail);
        return kExitUsage;
    }
    config::Loader::apply_env_overrides(*cfg);
    obs::init_logging(cfg->debug);
    if (cfg->dry_run) spdlog::info("dry-run: routes will not be changed");

    auto w = wire(*cfg);
    auto& c = *w.controller;

    if (cmd == "monitor")     return cmd_monitor(c, *cfg);
    if (cmd == "check")       return cmd_check(c);
    if (cmd == "status")      return cmd_status(c, *w.audit_log);
    if (cmd == "failover")    return cmd_failover(c, args[1]);
    if (cmd == "set-primary") return cmd_set_primary(c, args[1]);
    return cmd_reset(c);
}
