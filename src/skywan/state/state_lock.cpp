/**
 * @file state_lock.cpp
 * @brief flock(2)-based StateLock.
 */
#include "skywan/state/state_lock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <thread>
#include <unistd.h>

namespace skywan::state {

namespace {
constexpr std::chrono::milliseconds kPollInterval{100};
}

StateLock& StateLock::operator=(StateLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

StateLock::~StateLock() { release(); }

void StateLock::release() noexcept {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

skywan_detail::expected<StateLock, LockError>
StateLock::acquire(const std::filesystem::path& path, std::chrono::milliseconds timeout) {
    std::error_code ec;
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return skywan_detail::unexpected(LockError{LockErrc::OpenFailed,
            path.string() + ": " + std::strerror(errno)});
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) return StateLock(fd);
        if (errno != EWOULDBLOCK && errno != EINTR) {
            const int err = errno;
            ::close(fd);
            return skywan_detail::unexpected(LockError{LockErrc::OpenFailed,
                path.string() + ": " + std::strerror(err)});
        }
        if (std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(kPollInterval);
    }
    ::close(fd);
    return skywan_detail::unexpected(LockError{LockErrc::TimedOut,
        path.string() + " held by another process for " + std::to_string(timeout.count()) + "ms"});
}

} // namespace skywan::state
