/**
 * @file decision_engine.cpp
 * @brief Implementation of DecisionEngine and helpers.
 */
#include "skywan/routing/decision_engine.hpp"
#include "skywan/telemetry/trend_analyzer.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace skywan::routing {

namespace {

uint32_t at_least_one(uint32_t n) noexcept { return std::max<uint32_t>(1, n); }

} // namespace

int64_t DecisionEngine::cooldown_remaining(const state::FailoverState& s, int64_t now) const noexcept {
    const auto cooldown = cfg_.thresholds.failover_cooldown_s;
    if (s.last_action_epoch == 0 || cooldown <= 0) return 0;
    const int64_t elapsed = now - s.last_action_epoch;
    if (elapsed >= cooldown) return 0;
    return std::min(cooldown, cooldown - elapsed); // clock stepped back: full cooldown
}

std::string DecisionEngine::spike_reason(const telemetry::LinkMetrics& m) const {
    const auto& th = cfg_.thresholds;
    if (m.latency_ms > th.latency_spike_ms) {
        return fmt::format("Latency spike: {}ms > {}ms", m.latency_ms, th.latency_spike_ms);
    }
    if (m.packet_loss > th.packet_loss_spike) {
        return fmt::format("Packet loss spike: {:g} > {:g}", m.packet_loss, th.packet_loss_spike);
    }
    return {};
}

bool DecisionEngine::healthy_for_failback(const telemetry::LinkMetrics& m) const noexcept {
    const auto& th = cfg_.thresholds;
    return m.latency_ms <= th.latency_spike_ms &&
           m.packet_loss <= th.packet_loss_spike &&
           m.packet_loss <= th.failback_max_packet_loss &&
           m.latency_ms <= th.failback_max_latency_ms &&
           m.obstruction <= th.failback_max_obstruction;
}

std::optional<std::string>
DecisionEngine::track_recommendation(state::FailoverState& s,
                                     const std::optional<ScoreRecommendation>& rec) const {
    if (!rec) return std::nullopt; // scorer unavailable: leave pending state untouched

    if (rec->interface == s.current_primary) {
        s.failover_pending = false;
        s.stability_counter = 0;
        return std::nullopt;
    }

    const uint32_t required = at_least_one(cfg_.thresholds.required_stability_checks);
    s.failover_pending = true;
    s.stability_counter = std::min(s.stability_counter + 1, required);
    if (s.stability_counter >= required) return rec->interface;
    return std::nullopt;
}

Decision DecisionEngine::evaluate(const EvaluationInput& in) const {
    const auto& th = cfg_.thresholds;

    Decision d;
    d.next_state = in.state;
    auto& s = d.next_state;
    if (in.recommendation) s.last_scorer_recommendation = in.recommendation->interface;

    const bool on_default = s.current_primary == cfg_.primary_interface;
    if (on_default) s.failback_counter = 0;

    // Rule 1: unreachable telemetry while on the satellite link. Never subject to cooldown.
    if (!in.metrics && on_default) {
        d.action = Action{ActionKind::Failover, s.current_primary, cfg_.backup_interface,
                          "Metrics source unreachable", Trigger::Unreachable};
        d.note = d.action->reason;
        return d;
    }

    const int64_t cooling = cooldown_remaining(s, in.now);
    std::optional<Action> suppressed;
    auto offer = [&](Action a, bool bypass) {
        if (cooling == 0 || bypass) {
            d.note = a.reason;
            d.action = std::move(a);
            return true;
        }
        if (!suppressed) suppressed = std::move(a);
        return false;
    };

    // Rules 2 and 3 only guard the default primary.
    if (in.metrics && on_default) {
        const auto& m = *in.metrics;
        if (auto reason = spike_reason(m); !reason.empty()) {
            if (offer(Action{ActionKind::Failover, s.current_primary, cfg_.backup_interface,
                             std::move(reason), Trigger::ReactiveSpike},
                      th.reactive_bypasses_cooldown)) {
                return d;
            }
        } else if (in.previous) {
            auto trend = telemetry::analyze_trend(*in.previous, m, th);
            if (trend.degrading &&
                offer(Action{ActionKind::Failover, s.current_primary, cfg_.backup_interface,
                             "Predictive: " + trend.reason, Trigger::Predictive},
                      false)) {
                return d;
            }
        }
    }

    // Rule 4
    if (auto target = track_recommendation(s, in.recommendation)) {
        Action a{kind_for_target(*target), s.current_primary, *target,
                 fmt::format("Scorer recommended {} for {} consecutive checks", *target, s.stability_counter),
                 Trigger::Score};
        if (offer(std::move(a), false)) return d;
    }

    // Rule 5
    if (!on_default) {
        const uint32_t required = at_least_one(th.failback_stability_checks);
        if (in.metrics && healthy_for_failback(*in.metrics)) {
            s.failback_counter = std::min(s.failback_counter + 1, required);
        } else {
            s.failback_counter = 0;
        }
        if (s.failback_counter >= required) {
            Action a{ActionKind::Failback, s.current_primary, cfg_.primary_interface,
                     fmt::format("Primary {} healthy for {} consecutive checks",
                                 cfg_.primary_interface, s.failback_counter),
                     Trigger::Failback};
            if (offer(std::move(a), false)) return d;
        }
    }

    if (suppressed) {
        d.cooldown_blocked = true;
        d.note = fmt::format("Cooldown active ({}s remaining), suppressed {} {} -> {}: {}",
                             cooling, to_string(suppressed->kind), suppressed->from,
                             suppressed->to, suppressed->reason);
    } else if (!in.metrics) {
        d.note = fmt::format("Metrics source unreachable, staying on {} ({})",
                             s.current_primary, to_string(phase_of(s)));
    } else {
        d.note = fmt::format("No action: {} on {}", to_string(phase_of(s)), s.current_primary);
    }
    return d;
}

state::FailoverState DecisionEngine::apply_success(state::FailoverState s, const Action& action, int64_t now) {
    s.current_primary = action.to;
    s.failover_pending = false;
    s.stability_counter = 0;
    s.failback_counter = 0;
    s.last_action_epoch = now;
    return s;
}

PhaseView DecisionEngine::phase_of(const state::FailoverState& s) const noexcept {
    if (s.failover_pending) return {Phase::PendingFailover, s.stability_counter};
    if (s.current_primary != cfg_.primary_interface) {
        if (s.failback_counter > 0) return {Phase::PendingFailback, s.failback_counter};
        return {Phase::FailedOver, 0};
    }
    return {Phase::Active, 0};
}

state::FailoverState DecisionEngine::initial_state() const {
    state::FailoverState s;
    s.current_primary = cfg_.primary_interface;
    return s;
}

const char* to_string(ActionKind k) noexcept {
    switch (k) {
        case ActionKind::Failover: return "failover";
        case ActionKind::Failback: return "failback";
    }
    return "unknown";
}

const char* to_string(Trigger t) noexcept {
    switch (t) {
        case Trigger::Unreachable:   return "unreachable";
        case Trigger::ReactiveSpike: return "reactive_spike";
        case Trigger::Predictive:    return "predictive";
        case Trigger::Score:         return "score";
        case Trigger::Failback:      return "failback";
        case Trigger::Manual:        return "manual";
    }
    return "unknown";
}

std::string to_string(const PhaseView& p) {
    switch (p.phase) {
        case Phase::Active:          return "ACTIVE";
        case Phase::PendingFailover: return fmt::format("PENDING_FAILOVER({})", p.count);
        case Phase::FailedOver:      return "FAILED_OVER";
        case Phase::PendingFailback: return fmt::format("PENDING_FAILBACK({})", p.count);
    }
    return "UNKNOWN";
}

} // namespace skywan::routing
