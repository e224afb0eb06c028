/**
 * @file controller.cpp
 * @brief Implementation of FailoverController.
 */
#include "skywan/control/controller.hpp"
#include "skywan/state/state_lock.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace skywan::control {

using obs::DecisionEvent;
using obs::EventType;
using obs::Outcome;

namespace {

int64_t system_epoch() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

/// True when evaluation moved the state machine (ignores the cached recommendation).
bool progressed(const state::FailoverState& before, const state::FailoverState& after) {
    return before.current_primary != after.current_primary ||
           before.failover_pending != after.failover_pending ||
           before.stability_counter != after.stability_counter ||
           before.failback_counter != after.failback_counter;
}

/// Score, failback and manual switches move onto a working link, so the target must be up.
bool requires_available_target(routing::Trigger t) noexcept {
    return t == routing::Trigger::Score || t == routing::Trigger::Failback || t == routing::Trigger::Manual;
}

CycleError lock_error(const state::LockError& e) {
    return CycleError{CycleErrc::LockFailed, e.detail};
}

} // namespace

FailoverController::FailoverController(routing::DecisionEngine engine,
                                       state::StateStore& store,
                                       telemetry::MetricsSource& metrics,
                                       routing::Scorer* scorer,
                                       routing::RouteSwitch& route_switch,
                                       obs::AuditSink& audit,
                                       ControllerOptions opts,
                                       Clock clock)
    : engine_(std::move(engine)),
      store_(store),
      metrics_(metrics),
      scorer_(scorer),
      switch_(route_switch),
      audit_(audit),
      opts_(std::move(opts)),
      clock_(clock ? std::move(clock) : Clock(system_epoch)) {}

void FailoverController::emit(const std::vector<DecisionEvent>& events) {
    for (const auto& e : events) audit_.record(e);
}

state::FailoverState FailoverController::execute(const routing::Action& a,
                                                 const state::FailoverState& evaluated,
                                                 int64_t now,
                                                 CycleReport& report) {
    if (opts_.dry_run) {
        report.events.push_back(DecisionEvent{now, EventType::Evaluation, a.from, a.to,
            fmt::format("DRY_RUN: would {} {} -> {}: {}", routing::to_string(a.kind), a.from, a.to, a.reason),
            Outcome::Success});
        return evaluated;
    }

    spdlog::info("executing {} {} -> {} (trigger: {})", routing::to_string(a.kind), a.from, a.to,
                 routing::to_string(a.trigger));
    const auto res = switch_.apply(a.from, a.to);
    if (res.ok()) {
        report.executed = true;
        report.events.push_back(DecisionEvent{now,
            a.kind == routing::ActionKind::Failback ? EventType::Failback : EventType::Failover,
            a.from, a.to, a.reason, Outcome::Success});
        return routing::DecisionEngine::apply_success(evaluated, a, now);
    }

    const bool restored = switch_.bring_up(a.from);
    report.events.push_back(DecisionEvent{now, EventType::FailoverFailed, a.from, a.to,
        fmt::format("{} ({}; restore {} {})", a.reason, res.detail, a.from, restored ? "succeeded" : "failed"),
        Outcome::Failed});
    return evaluated;
}

CycleResult<CycleReport> FailoverController::run_cycle() {
    std::optional<telemetry::LinkMetrics> sample;
    if (auto m = metrics_.query()) {
        sample = *m;
    } else {
        spdlog::warn("metrics unavailable ({}): {}", telemetry::to_string(m.error().code), m.error().detail);
    }

    std::optional<routing::ScoreRecommendation> rec;
    if (scorer_) {
        const auto peek = store_.load_strict();
        const auto current = peek ? peek->current_primary : engine_.config().primary_interface;
        if (auto r = scorer_->recommend(current)) rec = *r;
        else spdlog::warn("scorer unavailable, skipping score rule: {}", r.error().detail);
    }

    auto lock = state::StateLock::acquire(opts_.lock_path, opts_.lock_timeout);
    if (!lock) return skywan_detail::unexpected(lock_error(lock.error()));

    CycleReport report;
    std::optional<CycleError> failure;
    {
        const state::StateLock held = std::move(*lock);
        const int64_t now = clock_();
        const auto loaded = store_.load();
        auto history = store_.load_history(opts_.history_length);

        report.decision = engine_.evaluate(routing::EvaluationInput{loaded, sample, history.latest(), rec, now});
        const auto& d = report.decision;

        if (d.action && requires_available_target(d.action->trigger) && !switch_.available(d.action->to)) {
            const auto& a = *d.action;
            report.state = d.next_state;
            report.events.push_back(DecisionEvent{now, EventType::Evaluation, a.from, a.to,
                fmt::format("{} not available, {} declined: {}", a.to, routing::to_string(a.kind), a.reason),
                Outcome::Success});
        } else if (d.action) {
            report.state = execute(*d.action, d.next_state, now, report);
        } else {
            report.state = d.next_state;
            if (d.cooldown_blocked || !sample || progressed(loaded, d.next_state)) {
                report.events.push_back(DecisionEvent{now, EventType::Evaluation, report.state.current_primary,
                                                      report.state.current_primary, d.note, Outcome::Success});
            } else {
                spdlog::debug("{}", d.note);
            }
        }

        if (sample) {
            history.push(*sample);
            if (auto h = store_.save_history(history); !h) spdlog::warn("metric history not saved: {}", h.error().detail);
        }
        if (auto s = store_.save(report.state); !s) {
            failure = CycleError{CycleErrc::PersistFailed, s.error().detail};
        }
    }

    emit(report.events);
    if (failure) return skywan_detail::unexpected(*failure);
    return report;
}

CycleResult<CycleReport> FailoverController::manual_failover(const std::string& iface) {
    if (iface.empty()) {
        return skywan_detail::unexpected(CycleError{CycleErrc::InvalidRequest, "interface name is empty"});
    }

    auto lock = state::StateLock::acquire(opts_.lock_path, opts_.lock_timeout);
    if (!lock) return skywan_detail::unexpected(lock_error(lock.error()));

    CycleReport report;
    std::optional<CycleError> failure;
    {
        const state::StateLock held = std::move(*lock);
        const int64_t now = clock_();
        const auto loaded = store_.load();
        if (iface == loaded.current_primary) {
            return skywan_detail::unexpected(CycleError{CycleErrc::InvalidRequest,
                iface + " is already the current primary"});
        }
        if (!switch_.available(iface)) {
            return skywan_detail::unexpected(CycleError{CycleErrc::InvalidRequest, iface + " is not available"});
        }

        const auto kind = engine_.kind_for_target(iface);
        routing::Action a{kind, loaded.current_primary, iface,
                          fmt::format("Manual {} requested by operator", routing::to_string(kind)),
                          routing::Trigger::Manual};
        report.decision.next_state = loaded;
        report.decision.note = a.reason;
        report.decision.action = a;

        report.state = execute(a, loaded, now, report);
        if (auto s = store_.save(report.state); !s) {
            failure = CycleError{CycleErrc::PersistFailed, s.error().detail};
        }
    }

    emit(report.events);
    if (failure) return skywan_detail::unexpected(*failure);
    if (!opts_.dry_run && !report.executed) {
        return skywan_detail::unexpected(CycleError{CycleErrc::SwitchFailed, report.events.back().reason});
    }
    return report;
}

CycleResult<state::FailoverState> FailoverController::set_primary(const std::string& iface) {
    if (iface.empty()) {
        return skywan_detail::unexpected(CycleError{CycleErrc::InvalidRequest, "interface name is empty"});
    }

    auto lock = state::StateLock::acquire(opts_.lock_path, opts_.lock_timeout);
    if (!lock) return skywan_detail::unexpected(lock_error(lock.error()));

    DecisionEvent event;
    state::FailoverState s;
    {
        const state::StateLock held = std::move(*lock);
        s = store_.load();
        const auto previous = s.current_primary;

        s.current_primary = iface;
        s.failover_pending = false;
        s.stability_counter = 0;
        s.failback_counter = 0;
        if (auto r = store_.save(s); !r) {
            return skywan_detail::unexpected(CycleError{CycleErrc::PersistFailed, r.error().detail});
        }
        event = DecisionEvent{clock_(), EventType::Evaluation, previous, iface,
                              fmt::format("Primary set to {} by operator", iface), Outcome::Success};
    }

    audit_.record(event);
    return s;
}

CycleResult<void> FailoverController::reset() {
    auto lock = state::StateLock::acquire(opts_.lock_path, opts_.lock_timeout);
    if (!lock) return skywan_detail::unexpected(lock_error(lock.error()));

    const state::StateLock held = std::move(*lock);
    if (auto r = store_.reset(); !r) {
        return skywan_detail::unexpected(CycleError{CycleErrc::PersistFailed, r.error().detail});
    }
    spdlog::info("state and metric history removed from {}", store_.dir().string());
    return {};
}

StatusReport FailoverController::status() const {
    StatusReport r;
    r.state = store_.load();
    r.phase = engine_.phase_of(r.state);
    r.cooldown_remaining_s = engine_.cooldown_remaining(r.state, clock_());
    r.last_metrics = store_.load_history(opts_.history_length).latest();
    return r;
}

std::optional<routing::ScoreResult> FailoverController::live_recommendation() {
    if (!scorer_) return std::nullopt;
    return scorer_->recommend(store_.load().current_primary);
}

const char* to_string(CycleErrc code) noexcept {
    switch (code) {
        case CycleErrc::LockFailed:     return "lock_failed";
        case CycleErrc::PersistFailed:  return "persist_failed";
        case CycleErrc::SwitchFailed:   return "switch_failed";
        case CycleErrc::InvalidRequest: return "invalid_request";
    }
    return "unknown";
}

} // namespace skywan::control
