#include "process.hpp"
#include "util.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sshmcp {

ChildGuard::~ChildGuard() {
    if (pid_ <= 0) return;
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
}

namespace {

struct Pipe {
    int fds[2] = {-1, -1};
    ~Pipe() { close_read(); close_write(); }
    bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }
    void close_read() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

struct Capture {
    std::string data;
    bool truncated = false;
    bool open = true;
};

// Appends up to the cap; the rest is drained and discarded so the child
// never blocks on a full pipe.
void drain(int fd, Capture& cap, size_t max_output) {
    std::array<char, 4096> buffer;
    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0) {
        size_t room = cap.data.size() < max_output ? max_output - cap.data.size() : 0;
        size_t take = std::min(room, static_cast<size_t>(n));
        cap.data.append(buffer.data(), take);
        if (take < static_cast<size_t>(n)) cap.truncated = true;
        return;
    }
    if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        cap.open = false;
    }
}

} // namespace

ExecOutcome run_process(const ExecRequest& request) {
    if (request.argv.empty() || request.argv[0].empty()) {
        return ToolFailure{ErrorKind::SpawnError, "Empty command"};
    }

    Pipe out_pipe, err_pipe, exec_pipe;
    if (!out_pipe.open() || !err_pipe.open() || !exec_pipe.open()) {
        return ToolFailure{ErrorKind::SpawnError,
                           std::string("Failed to create pipes: ") + std::strerror(errno)};
    }

    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        return ToolFailure{ErrorKind::SpawnError,
                           std::string("Failed to fork process: ") + std::strerror(errno)};
    }

    if (pid == 0) {
        // Child: own session so the timeout can kill the whole group
        ::setsid();
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe.fds[1], STDOUT_FILENO);
        ::dup2(err_pipe.fds[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe.fds[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ChildGuard guard(pid);
    out_pipe.close_write();
    err_pipe.close_write();
    exec_pipe.close_write();

    // exec_pipe closes on successful exec (O_CLOEXEC); data means exec failed
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.fds[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        return ToolFailure{ErrorKind::SpawnError,
                           "Failed to execute " + request.argv[0] + ": " +
                           std::strerror(exec_errno)};
    }

    auto deadline = start + request.timeout;
    Capture out_cap, err_cap;

    while (out_cap.open || err_cap.open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return ToolFailure{ErrorKind::Timeout,
                               request.argv[0] + " timed out after " +
                               std::to_string(request.timeout.count()) + "ms"};
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_cap.open) { fds[count].fd = out_pipe.fds[0]; fds[count].events = POLLIN; count++; }
        if (err_cap.open) { fds[count].fd = err_pipe.fds[0]; fds[count].events = POLLIN; count++; }

        int ret = ::poll(fds, count, static_cast<int>(remaining));
        if (ret < 0) {
            if (errno == EINTR) continue;
            return ToolFailure{ErrorKind::InternalError,
                               std::string("poll failed: ") + std::strerror(errno)};
        }
        if (ret == 0) continue;

        for (nfds_t i = 0; i < count; i++) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            if (fds[i].fd == out_pipe.fds[0]) drain(fds[i].fd, out_cap, request.max_output);
            else drain(fds[i].fd, err_cap, request.max_output);
        }
    }

    // Both streams closed; the child may still linger (e.g. closed its
    // stdout early), so keep honoring the deadline while waiting. WNOWAIT
    // leaves the zombie in place so the group id cannot be reused before
    // the group is killed.
    while (true) {
        siginfo_t info{};
        int r = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (r == 0 && info.si_pid == pid) break;
        if (r < 0 && errno != EINTR) {
            return ToolFailure{ErrorKind::InternalError,
                               std::string("waitid failed: ") + std::strerror(errno)};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return ToolFailure{ErrorKind::Timeout,
                               request.argv[0] + " timed out after " +
                               std::to_string(request.timeout.count()) + "ms"};
        }
        ::usleep(5000);
    }
    ::kill(-pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    guard.release();

    ExecResult result;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    result.stdout_data = std::move(out_cap.data);
    result.stderr_data = std::move(err_cap.data);
    result.stdout_truncated = out_cap.truncated;
    result.stderr_truncated = err_cap.truncated;
    if (result.stdout_truncated) result.stdout_data += "\n[truncated]";
    if (result.stderr_truncated) result.stderr_data += "\n[truncated]";
    result.elapsed_ms = elapsed_ms(start);
    return result;
}

} // namespace sshmcp
