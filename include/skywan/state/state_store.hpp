#pragma once
/**
 * @file state_store.hpp
 * @brief Durable key=value persistence of FailoverState and MetricHistory.
 * @details Every write goes to a temp file in the same directory, is fsync'ed, then renamed
 *          over the target, so a crash never leaves a partially written state file.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "skywan/compat/expected.hpp"
#include "skywan/state/failover_state.hpp"
#include "skywan/telemetry/metric_history.hpp"

namespace skywan::state {

    enum class StoreErrc : std::uint8_t {
        Io = 1,  ///< Read/write/rename failed
        Corrupt  ///< Content could not be decoded
    };

    struct StoreError {
        StoreErrc   code;
        std::string detail;
    };

    template<class T>
    using StoreResult = skywan_detail::expected<T, StoreError>;

    /// Serialise as newline-delimited key=value lines. Fails on values containing a newline.
    StoreResult<std::string> encode_state(const FailoverState& s);

    /// Inverse of encode_state(). Unknown keys are ignored.
    StoreResult<FailoverState> decode_state(std::string_view text);

    /// Write @p content to @p target via temp file + fsync + rename.
    StoreResult<void> write_file_atomic(const std::filesystem::path& target, std::string_view content);

    /** @class StateStore
     *  @brief Owns the state and history files under one directory.
     */
    class StateStore {
    public:
        StateStore(std::filesystem::path dir, std::string default_primary);

        /**
         * @brief Load persisted state.
         * @return Stored state; defaults (with a logged warning) if absent or unreadable.
         */
        FailoverState load() const;

        /// Load without falling back, for callers that must distinguish "absent" from "corrupt".
        StoreResult<FailoverState> load_strict() const;

        /// Atomically replace the state file. Creates the directory if needed.
        StoreResult<void> save(const FailoverState& s) const;

        /// Load the persisted history; empty on absence, malformed rows skipped.
        telemetry::MetricHistory load_history(std::size_t capacity) const;

        /// Atomically replace the history file.
        StoreResult<void> save_history(const telemetry::MetricHistory& h) const;

        /// Remove state and history files. Missing files are not an error.
        StoreResult<void> reset() const;

        /// Defaults used on first run.
        FailoverState defaults() const;

        const std::filesystem::path& dir() const noexcept { return dir_; }
        std::filesystem::path state_path() const;
        std::filesystem::path history_path() const;

    private:
        StoreResult<void> ensure_dir() const;

        std::filesystem::path dir_;
        std::string           default_primary_;
    };

} // namespace skywan::state
