#if defined(__linux__) || defined(__unix__)

#include "skywan/os/subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace skywan::os {

namespace {

using Clock = std::chrono::steady_clock;

/// Upper bound on one poll() so child exit is noticed while the pipe stays open.
constexpr int kPollSliceMs = 20;

/// Signals a monitor process may block or ignore; children start with the defaults.
constexpr int kResetSignals[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT, SIGPIPE, SIGCHLD};

/// Blocking reap; retries on EINTR.
int reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return status;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

/// SIGKILL the child's process group (and the child itself if setpgid had not run yet), then reap.
void kill_group(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    (void)reap(pid);
}

/// Runs in the forked child: async-signal-safe calls only.
[[noreturn]] void exec_child(char* const* args, int out_fd) {
    ::setpgid(0, 0);

    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    struct sigaction dfl{};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    for (int sig : kResetSignals) ::sigaction(sig, &dfl, nullptr);

    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) { ::dup2(devnull, STDIN_FILENO); ::close(devnull); }
    ::dup2(out_fd, STDOUT_FILENO);
    ::close(out_fd);

    ::execvp(args[0], args);
    ::_exit(127); // exec failed; same code as a shell "command not found"
}

void append_capped(std::string& out, const char* buf, ssize_t n) {
    if (out.size() >= kMaxOutputBytes) return;
    const auto room = kMaxOutputBytes - out.size();
    out.append(buf, std::min<std::size_t>(room, static_cast<std::size_t>(n)));
}

/// Non-blocking read of whatever is buffered. false on EOF.
bool read_available(int fd, std::string& out, int& err) {
    char buf[4096];
    for (;;) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            append_capped(out, buf, n);
            if (out.size() >= kMaxOutputBytes) return true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) err = errno;
        return true;
    }
}

} // namespace

skywan_detail::expected<ProcessResult, ProcessError>
run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty() || argv.front().empty()) {
        return skywan_detail::unexpected(ProcessError{ProcessErrc::EmptyCommand, "no command configured"});
    }

    // Built before fork(): the child must not allocate.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return skywan_detail::unexpected(ProcessError{ProcessErrc::SpawnFailed,
                                                      std::string("pipe: ") + std::strerror(errno)});
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(fds[0]); ::close(fds[1]);
        return skywan_detail::unexpected(ProcessError{ProcessErrc::SpawnFailed,
                                                      std::string("fork: ") + std::strerror(err)});
    }
    if (pid == 0) {
        ::close(fds[0]);
        exec_child(args.data(), fds[1]);
    }
    ::setpgid(pid, pid); // also set by the child; whichever runs first wins
    ::close(fds[1]);

    int out_fd = fds[0];
    ::fcntl(out_fd, F_SETFL, ::fcntl(out_fd, F_GETFL) | O_NONBLOCK);
    const auto close_out = [&out_fd] {
        if (out_fd >= 0) { ::close(out_fd); out_fd = -1; }
    };
    const auto fail = [&](ProcessErrc code, std::string detail) {
        close_out();
        kill_group(pid);
        return skywan_detail::unexpected(ProcessError{code, std::move(detail)});
    };

    const auto deadline = Clock::now() + timeout;
    ProcessResult result;

    // Completion is the child's exit, not EOF: background helpers may keep stdout open.
    for (;;) {
        int status = 0;
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            if (out_fd >= 0) {
                int err = 0;
                (void)read_available(out_fd, result.output, err);
                close_out();
            }
            result.exit_status = decode_status(status);
            return result;
        }
        if (r < 0 && errno != EINTR) {
            return fail(ProcessErrc::ReadFailed, std::string("waitpid: ") + std::strerror(errno));
        }

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) {
            return fail(ProcessErrc::TimedOut,
                        describe(argv) + " exceeded " + std::to_string(timeout.count()) + "ms");
        }
        const int slice = static_cast<int>(std::min<std::int64_t>(left.count(), kPollSliceMs));

        if (out_fd < 0) {
            ::usleep(static_cast<useconds_t>(slice) * 1000);
            continue;
        }

        pollfd pfd{out_fd, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, slice);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return fail(ProcessErrc::ReadFailed, std::string("poll: ") + std::strerror(errno));
        }
        if (rc == 0) continue;

        int err = 0;
        const bool more = read_available(out_fd, result.output, err);
        if (err != 0) return fail(ProcessErrc::ReadFailed, std::string("read: ") + std::strerror(err));
        if (!more) close_out();
    }
}

const char* to_string(ProcessErrc code) noexcept {
    switch (code) {
        case ProcessErrc::EmptyCommand: return "empty_command";
        case ProcessErrc::SpawnFailed:  return "spawn_failed";
        case ProcessErrc::TimedOut:     return "timed_out";
        case ProcessErrc::ReadFailed:   return "read_failed";
    }
    return "unknown";
}

std::string describe(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

} // namespace skywan::os
#endif
