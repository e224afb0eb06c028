#pragma once
/**
 * @file decision_engine.hpp
 * @brief Rule-based failover/failback decisions with hysteresis and cooldown.
 * @details evaluate() is pure: state goes in, a new state plus an optional action comes out.
 *          Executing the action and persisting the result belong to the controller.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "skywan/routing/scorer.hpp"
#include "skywan/routing/thresholds.hpp"
#include "skywan/state/failover_state.hpp"
#include "skywan/telemetry/link_metrics.hpp"

namespace skywan::routing {

/** @enum ActionKind
 *  @brief Direction of a switch relative to the configured default primary.
 */
enum class ActionKind : uint8_t { Failover, Failback };

/** @enum Trigger
 *  @brief Rule that produced an action.
 */
enum class Trigger : uint8_t {
    Unreachable,   ///< Rule 1: telemetry missing
    ReactiveSpike, ///< Rule 2: latency or loss above threshold
    Predictive,    ///< Rule 3: degrading trend
    Score,         ///< Rule 4: stable scorer recommendation
    Failback,      ///< Rule 5: sustained primary health
    Manual         ///< Operator request
};

/** @struct Action
 *  @brief A switch the controller should execute.
 */
struct Action {
    ActionKind  kind{ActionKind::Failover};
    std::string from;                  ///< Interface to take down
    std::string to;                    ///< Interface to bring up
    std::string reason;                ///< Audit/log reason
    Trigger     trigger{Trigger::Manual};
};

/** @struct EvaluationInput
 *  @brief One cycle's worth of inputs.
 */
struct EvaluationInput {
    skywan::state::FailoverState           state;          ///< State loaded at cycle start
    std::optional<telemetry::LinkMetrics>  metrics;        ///< Absent when the source was unreachable
    std::optional<telemetry::LinkMetrics>  previous;       ///< Prior sample from history, if any
    std::optional<ScoreRecommendation>     recommendation; ///< Absent when the scorer failed
    int64_t                                now{0};         ///< Unix epoch seconds
};

/** @struct Decision
 *  @brief Result of evaluate().
 */
struct Decision {
    state::FailoverState  next_state;            ///< State to persist if no action runs
    std::optional<Action> action;                ///< Switch to execute, if any
    std::string           note;                  ///< Summary for the EVALUATION event
    bool                  cooldown_blocked{false}; ///< A trigger fired but cooldown suppressed it
};

/** @struct DecisionConfig
 *  @brief Interfaces and thresholds the engine evaluates against.
 */
struct DecisionConfig {
    std::string primary_interface; ///< Default primary (satellite)
    std::string backup_interface;  ///< Failover target (cellular)
    Thresholds  thresholds{};
};

/** @enum Phase
 *  @brief Derived view of the state machine, never persisted.
 */
enum class Phase : uint8_t { Active, PendingFailover, FailedOver, PendingFailback };

struct PhaseView {
    Phase    phase{Phase::Active};
    uint32_t count{0}; ///< Counter for the pending phases, 0 otherwise
};

/** @class DecisionEngine
 *  @brief Applies the five failover rules in priority order.
 */
class DecisionEngine {
public:
    /// Construct with configuration.
    explicit DecisionEngine(DecisionConfig cfg) noexcept : cfg_(std::move(cfg)) {}

    /**
     * @brief Evaluate one cycle.
     *
     * Order (first executable match wins): unreachability, reactive spikes, predictive trend,
     * score-based recommendation, failback. Everything except unreachability is suppressed while
     * `now - last_action_epoch < failover_cooldown_s`; counters still advance.
     */
    Decision evaluate(const EvaluationInput& in) const;

    /// State after @p action executed successfully at @p now.
    static state::FailoverState apply_success(state::FailoverState s, const Action& action, int64_t now);

    /// Failover when leaving the default primary, Failback when returning to it.
    ActionKind kind_for_target(const std::string& to) const noexcept {
        return to == cfg_.primary_interface ? ActionKind::Failback : ActionKind::Failover;
    }

    /// Derive the phase of @p s.
    PhaseView phase_of(const state::FailoverState& s) const noexcept;

    /// Seconds of cooldown left at @p now, 0 when none.
    int64_t cooldown_remaining(const state::FailoverState& s, int64_t now) const noexcept;

    /// Fresh state for a first run.
    state::FailoverState initial_state() const;

    /// @return Current configuration (by const reference).
    const DecisionConfig& config() const noexcept { return cfg_; }

private:
    /// Rule 4 bookkeeping; returns the transition target once confirmed.
    std::optional<std::string> track_recommendation(state::FailoverState& s,
                                                    const std::optional<ScoreRecommendation>& rec) const;

    /// Rule 5 health predicate.
    bool healthy_for_failback(const telemetry::LinkMetrics& m) const noexcept;

    /// Reactive spike reason, empty when none.
    std::string spike_reason(const telemetry::LinkMetrics& m) const;

private:
    DecisionConfig cfg_{}; ///< Engine configuration
};

const char* to_string(ActionKind k) noexcept;
const char* to_string(Trigger t) noexcept;
std::string to_string(const PhaseView& p);

} // namespace skywan::routing
