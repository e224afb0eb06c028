#pragma once
/**
 * @file state_lock.hpp
 * @brief Advisory inter-process lock serialising load/evaluate/act/save.
 * @note POSIX flock(2). Released on destruction or process exit.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "skywan/compat/expected.hpp"

namespace skywan::state {

    enum class LockErrc : std::uint8_t {
        OpenFailed = 1, ///< Lock file could not be created
        TimedOut        ///< Held by another process past the timeout
    };

    struct LockError {
        LockErrc    code;
        std::string detail;
    };

    /** @class StateLock
     *  @brief Move-only RAII holder of an exclusive flock.
     */
    class StateLock {
    public:
        StateLock(StateLock&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
        StateLock& operator=(StateLock&& other) noexcept;
        StateLock(const StateLock&) = delete;
        StateLock& operator=(const StateLock&) = delete;
        ~StateLock();

        /**
         * @brief Acquire the lock, polling until @p timeout elapses.
         * @param path Lock file; created (with parent directories) when missing.
         * @param timeout Zero means a single non-blocking attempt.
         */
        static skywan_detail::expected<StateLock, LockError>
        acquire(const std::filesystem::path& path, std::chrono::milliseconds timeout);

        [[nodiscard]] bool held() const noexcept { return fd_ >= 0; }

    private:
        explicit StateLock(int fd) noexcept : fd_(fd) {}
        void release() noexcept;

        int fd_{-1};
    };

} // namespace skywan::state
