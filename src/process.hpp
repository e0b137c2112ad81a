#pragma once
#include "tool.hpp"
#include <chrono>
#include <string>
#include <vector>
#include <variant>
#include <sys/types.h>

namespace sshmcp {

struct ExecRequest {
    std::vector<std::string> argv;  // argv[0] is looked up on PATH
    std::chrono::milliseconds timeout{5000};
    size_t max_output = 65536;      // cap per stream
};

struct ExecResult {
    int exit_code = -1;    // -1 when terminated by a signal
    int term_signal = 0;
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    int64_t elapsed_ms = 0;
};

// Either a completed run (any exit code) or Timeout/SpawnError.
using ExecOutcome = std::variant<ExecResult, ToolFailure>;

// Run a command without a shell. The child gets its own session and
// /dev/null as stdin; on deadline the whole process group is killed and
// reaped before returning.
ExecOutcome run_process(const ExecRequest& request);

// Kills (SIGKILL to the process group) and reaps a child unless release()d.
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}
    ~ChildGuard();
    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    void release() { pid_ = -1; }

private:
    pid_t pid_;
};

} // namespace sshmcp
