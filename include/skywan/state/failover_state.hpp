#pragma once
/**
 * @file failover_state.hpp
 * @brief Persisted failover state threaded through every evaluation cycle.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace skywan::state {

/** @struct FailoverState
 *  @brief Everything the engine remembers between cycles.
 *
 * Invariants: `stability_counter == 0` when not pending; `1 <= stability_counter <= N` while
 * pending; `failback_counter == 0` while the default primary is active.
 */
struct FailoverState {
    std::string                current_primary;            ///< Interface carrying traffic
    bool                       failover_pending{false};    ///< Score-based switch awaiting confirmation
    uint32_t                   stability_counter{0};       ///< Consecutive confirmations while pending
    uint32_t                   failback_counter{0};        ///< Consecutive healthy cycles while failed over
    int64_t                    last_action_epoch{0};       ///< Last executed switch, 0 = never
    std::optional<std::string> last_scorer_recommendation; ///< Most recent scorer answer

    bool operator==(const FailoverState&) const = default;
};

} // namespace skywan::state
