#pragma once
/**
 * @file subprocess.hpp
 * @brief Bounded external command execution for the collaborator adapters.
 * @note POSIX only (fork/exec/poll). Each command runs in its own process group with the
 *       default signal mask; a command that outlives its timeout is killed with its group.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "skywan/compat/expected.hpp"

namespace skywan::os {

    /// @brief Why a command produced no result.
    enum class ProcessErrc : std::uint8_t {
        EmptyCommand = 1, ///< argv was empty
        SpawnFailed,      ///< pipe/fork failed
        TimedOut,         ///< deadline passed; child's process group was killed
        ReadFailed        ///< reading the child's stdout failed
    };

    struct ProcessError {
        ProcessErrc code;
        std::string detail;
    };

    /// @brief Exit status and captured stdout of a finished command.
    struct ProcessResult {
        int         exit_status{0}; ///< WEXITSTATUS, or 128 + signal number
        std::string output;         ///< stdout, truncated at kMaxOutputBytes

        [[nodiscard]] bool ok() const noexcept { return exit_status == 0; }
    };

    /// Captured stdout is truncated beyond this size.
    inline constexpr std::size_t kMaxOutputBytes = 64 * 1024;

    /**
     * @brief Run argv[0] (PATH lookup) with argv[1..], stdin from /dev/null, stderr inherited.
     *
     * The run ends when the child exits. Output already written is kept even if a
     * background process it started still holds stdout open.
     * @param argv Program and arguments.
     * @param timeout Wall-clock bound for the whole run.
     * @return ProcessResult on completion (any exit status); ProcessError otherwise.
     */
    skywan_detail::expected<ProcessResult, ProcessError>
    run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

    /// Human-readable name for logs.
    const char* to_string(ProcessErrc code) noexcept;

    /// Join argv with spaces for logs.
    std::string describe(const std::vector<std::string>& argv);

} // namespace skywan::os
