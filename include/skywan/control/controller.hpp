#pragma once
/**
 * @file controller.hpp
 * @brief One evaluation cycle: query, lock, load, evaluate, act, save, emit.
 *
 * **Cycle**
 * - Query telemetry and the scorer without holding the lock.
 * - Under the state lock: load state and history, evaluate, execute the action (or roll back),
 *   persist state and history. Score, failback and manual switches are declined while the
 *   target is not available.
 * - After the lock is released: emit audit events (file, log, notifier).
 *
 * **Invariants**
 * - current_primary changes only after the Route Switch Executor reports success.
 * - At most one cycle mutates state at a time across processes.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "skywan/compat/expected.hpp"
#include "skywan/config/constants.hpp"
#include "skywan/obs/observability.hpp"
#include "skywan/routing/decision_engine.hpp"
#include "skywan/routing/route_switch.hpp"
#include "skywan/routing/scorer.hpp"
#include "skywan/state/state_store.hpp"
#include "skywan/telemetry/metrics_source.hpp"

namespace skywan::control {

    /** @struct ControllerOptions
     *  @brief Runtime knobs that do not affect rule evaluation.
     */
    struct ControllerOptions {
        std::filesystem::path     lock_path;      ///< flock target
        std::chrono::milliseconds lock_timeout{std::chrono::seconds(skywan::config::constants::LOCK_TIMEOUT_S)};
        std::size_t               history_length{skywan::config::constants::METRIC_HISTORY_LENGTH};
        bool                      dry_run{false}; ///< Never call the executor
    };

    enum class CycleErrc : std::uint8_t {
        LockFailed = 1, ///< State lock not acquired; nothing was evaluated
        PersistFailed,  ///< State could not be written
        SwitchFailed,   ///< Executor failed (rollback attempted)
        InvalidRequest  ///< Operator request rejected
    };

    struct CycleError {
        CycleErrc   code;
        std::string detail;
    };

    /** @struct CycleReport
     *  @brief What a cycle decided and did.
     */
    struct CycleReport {
        routing::Decision               decision; ///< Engine output
        skywan::state::FailoverState    state;    ///< State persisted at the end of the cycle
        std::vector<obs::DecisionEvent> events;   ///< Events emitted, in order
        bool                            executed{false}; ///< A switch ran and succeeded
    };

    /** @struct StatusReport
     *  @brief Read-only snapshot for `status`.
     */
    struct StatusReport {
        skywan::state::FailoverState          state;
        routing::PhaseView                    phase;
        int64_t                               cooldown_remaining_s{0};
        std::optional<telemetry::LinkMetrics> last_metrics;
    };

    template<class T>
    using CycleResult = skywan_detail::expected<T, CycleError>;

    /** @class FailoverController
     *  @brief Wires the decision engine to its collaborators. Collaborators are borrowed.
     */
    class FailoverController {
    public:
        using Clock = std::function<int64_t()>;

        /**
         * @param scorer Optional; nullptr skips the score-based rule.
         * @param clock Epoch-seconds source; defaults to the system clock.
         */
        FailoverController(routing::DecisionEngine engine,
                           state::StateStore& store,
                           telemetry::MetricsSource& metrics,
                           routing::Scorer* scorer,
                           routing::RouteSwitch& route_switch,
                           obs::AuditSink& audit,
                           ControllerOptions opts,
                           Clock clock = {});

        /// One monitoring cycle (`check`, and each `monitor` tick).
        CycleResult<CycleReport> run_cycle();

        /// Switch to @p iface now, bypassing cooldown and stability. Still logged.
        /// InvalidRequest when @p iface is already primary or not available.
        CycleResult<CycleReport> manual_failover(const std::string& iface);

        /// Record @p iface as current primary without touching routes.
        CycleResult<state::FailoverState> set_primary(const std::string& iface);

        /// Delete persisted state and history.
        CycleResult<void> reset();

        /// Snapshot without taking the lock.
        StatusReport status() const;

        /// Ask the scorer now about the persisted primary. std::nullopt without a scorer.
        std::optional<routing::ScoreResult> live_recommendation();

        const routing::DecisionEngine& engine() const noexcept { return engine_; }

    private:
        /// Run @p action through the executor (or dry-run); returns the resulting state.
        state::FailoverState execute(const routing::Action& action,
                                     const state::FailoverState& evaluated,
                                     int64_t now,
                                     CycleReport& report);

        void emit(const std::vector<obs::DecisionEvent>& events);

        routing::DecisionEngine   engine_;
        state::StateStore&        store_;
        telemetry::MetricsSource& metrics_;
        routing::Scorer*          scorer_;
        routing::RouteSwitch&     switch_;
        obs::AuditSink&           audit_;
        ControllerOptions         opts_;
        Clock                     clock_;
    };

    const char* to_string(CycleErrc code) noexcept;

} // namespace skywan::control
