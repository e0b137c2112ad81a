#include <catch2/catch_test_macros.hpp>
#include "process.hpp"
#include "test_support.hpp"
#include <filesystem>

using namespace sshmcp;

static ExecResult expect_result(const ExecOutcome& outcome) {
    REQUIRE(std::holds_alternative<ExecResult>(outcome));
    return std::get<ExecResult>(outcome);
}

static ToolFailure expect_failure(const ExecOutcome& outcome) {
    REQUIRE(std::holds_alternative<ToolFailure>(outcome));
    return std::get<ToolFailure>(outcome);
}

// ── Normal runs ──────────────────────────────────────────────────

TEST_CASE("run_process: captures stdout and exit code", "[process]") {
    ExecRequest req;
    req.argv = {"/bin/sh", "-c", "echo hello"};
    auto r = expect_result(run_process(req));
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.term_signal == 0);
    REQUIRE(r.stdout_data == "hello\n");
    REQUIRE(r.stderr_data.empty());
    REQUIRE_FALSE(r.stdout_truncated);
}

TEST_CASE("run_process: non-zero exit is still a result", "[process]") {
    ExecRequest req;
    req.argv = {"/bin/sh", "-c", "echo oops >&2; exit 3"};
    auto r = expect_result(run_process(req));
    REQUIRE(r.exit_code == 3);
    REQUIRE(r.stderr_data == "oops\n");
}

TEST_CASE("run_process: arguments are not shell-expanded", "[process]") {
    ExecRequest req;
    req.argv = {"/bin/echo", "$HOME; rm -rf /", "*"};
    auto r = expect_result(run_process(req));
    REQUIRE(r.stdout_data == "$HOME; rm -rf / *\n");
}

TEST_CASE("run_process: stdin is /dev/null", "[process]") {
    ExecRequest req;
    req.argv = {"/bin/cat"};
    auto r = expect_result(run_process(req));
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.stdout_data.empty());
}

TEST_CASE("run_process: killed by signal reports term_signal", "[process]") {
    ExecRequest req;
    req.argv = {"/bin/sh", "-c", "kill -TERM $$"};
    auto r = expect_result(run_process(req));
    REQUIRE(r.exit_code == -1);
    REQUIRE(r.term_signal == SIGTERM);
}

// ── Output cap ───────────────────────────────────────────────────

TEST_CASE("run_process: output past the cap is truncated with marker", "[process]") {
    ExecRequest req;
    req.argv = {"/bin/sh", "-c", "head -c 100000 /dev/zero | tr '\\0' 'x'"};
    req.max_output = 1000;
    auto r = expect_result(run_process(req));
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.stdout_truncated);
    REQUIRE(r.stdout_data.size() == 1000 + std::string("\n[truncated]").size());
    REQUIRE(r.stdout_data.substr(0, 5) == "xxxxx");
    REQUIRE(r.stdout_data.find("[truncated]") == 1001);
}

// ── Failures ─────────────────────────────────────────────────────

TEST_CASE("run_process: timeout kills the child early", "[process]") {
    ExecRequest req;
    req.argv = {"/bin/sh", "-c", "sleep 10"};
    req.timeout = std::chrono::milliseconds(300);

    auto start = std::chrono::steady_clock::now();
    auto f = expect_failure(run_process(req));
    REQUIRE(f.kind == ErrorKind::Timeout);
    REQUIRE(f.message.find("timed out after 300ms") != std::string::npos);
    REQUIRE(elapsed_ms(start) < 3000);
}

TEST_CASE("run_process: timeout also kills grandchildren holding the pipe", "[process]") {
    ExecRequest req;
    // The background sleep inherits stdout; without a group kill the read
    // side would stay open for ten seconds.
    req.argv = {"/bin/sh", "-c", "sleep 10 & sleep 10"};
    req.timeout = std::chrono::milliseconds(300);

    auto start = std::chrono::steady_clock::now();
    auto f = expect_failure(run_process(req));
    REQUIRE(f.kind == ErrorKind::Timeout);
    REQUIRE(elapsed_ms(start) < 3000);
}

TEST_CASE("run_process: missing binary is a SpawnError", "[process]") {
    ExecRequest req;
    req.argv = {"/nonexistent/sshmcp-no-such-binary"};
    auto f = expect_failure(run_process(req));
    REQUIRE(f.kind == ErrorKind::SpawnError);
    REQUIRE(f.message.find("sshmcp-no-such-binary") != std::string::npos);
}

TEST_CASE("run_process: empty argv is a SpawnError", "[process]") {
    ExecRequest req;
    auto f = expect_failure(run_process(req));
    REQUIRE(f.kind == ErrorKind::SpawnError);
}

TEST_CASE("run_process: non-executable file is a SpawnError", "[process]") {
    auto dir = sshmcp_test::make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    sshmcp_test::write_file(dir + "/plain", "#!/bin/sh\necho hi\n", 0644);

    ExecRequest req;
    req.argv = {dir + "/plain"};
    auto outcome = run_process(req);
    // execve needs at least one x bit, even for root
    REQUIRE(std::holds_alternative<ToolFailure>(outcome));
    REQUIRE(std::get<ToolFailure>(outcome).kind == ErrorKind::SpawnError);

    std::filesystem::remove_all(dir);
}
