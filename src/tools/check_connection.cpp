#include "check_connection.hpp"
#include "tool_util.hpp"
#include "../config.hpp"
#include "../net_probe.hpp"
#include "../util.hpp"

namespace sshmcp {

std::string classify_auth_probe(const ExecResult& result) {
    if (result.exit_code == 0) return "authenticated";

    std::string err = to_lower(result.stderr_data);
    if (err.find("permission denied") != std::string::npos ||
        err.find("too many authentication failures") != std::string::npos) {
        return "auth_failed";
    }
    if (err.find("host key verification failed") != std::string::npos ||
        err.find("remote host identification has changed") != std::string::npos) {
        return "host_key_rejected";
    }
    if (err.find("connection refused") != std::string::npos) return "refused";
    if (err.find("timed out") != std::string::npos) return "timeout";
    if (err.find("could not resolve hostname") != std::string::npos) return "resolution_failed";
    if (err.find("kex_exchange_identification") != std::string::npos ||
        err.find("no matching") != std::string::npos ||
        err.find("protocol") != std::string::npos ||
        err.find("banner") != std::string::npos) {
        return "protocol_error";
    }
    return "unknown";
}

CheckConnectionTool::CheckConnectionTool(const Config& cfg)
    : ssh_binary_(cfg.ssh.binary)
    , max_output_(cfg.limits.max_output_bytes)
{
    descriptor_.name = "check_ssh_connection";
    descriptor_.description =
        "Check whether an SSH server is reachable: a TCP connect probe, then "
        "(optionally) a non-interactive authentication probe with the local ssh client. "
        "An unreachable host is reported as a successful diagnosis with reachable=false.";
    descriptor_.params = {
        string_param("host", "Hostname or IP address of the SSH server", true),
        int_param("port", "SSH port", false, 22, 1, 65535),
        string_param("user", "User name for the authentication probe", false),
        int_param("timeout", "Connect timeout in seconds", false, 5, 1, 60),
        bool_param("auth_probe", "Run a BatchMode ssh authentication probe once the port answers", true),
    };
}

ToolResult CheckConnectionTool::execute(const nlohmann::json& args) {
    std::string host = arg_string(args, "host");
    int64_t port = arg_int(args, "port", 22);
    std::string user = arg_string(args, "user");
    int64_t timeout_s = arg_int(args, "timeout", 5);
    bool auth_probe = arg_bool(args, "auth_probe", true);

    if (host.empty()) {
        return ToolResult::failure(ErrorKind::InvalidInput, "host must not be empty");
    }

    auto outcome = probe_tcp(host, static_cast<uint16_t>(port),
                             std::chrono::seconds(timeout_s));

    nlohmann::json payload = {
        {"host", host},
        {"port", port},
        {"reachable", outcome.reachable},
    };

    if (!outcome.reachable) {
        payload["stage"] = "network";
        payload["detail"] = outcome.detail;
        return ToolResult::success(std::move(payload));
    }

    payload["latency_ms"] = outcome.latency_ms;
    payload["address"] = outcome.address;
    if (!auth_probe) {
        payload["stage"] = "network";
        return ToolResult::success(std::move(payload));
    }

    payload["stage"] = "auth";
    payload["auth_stage_result"] = run_auth_probe(host, port, user, timeout_s);
    return ToolResult::success(std::move(payload));
}

nlohmann::json CheckConnectionTool::run_auth_probe(const std::string& host, int64_t port,
                                                   const std::string& user,
                                                   int64_t timeout_s) const {
    ExecRequest req;
    req.argv = {
        ssh_binary_, "-T",
        "-o", "BatchMode=yes",
        "-o", "ConnectTimeout=" + std::to_string(timeout_s),
        "-o", "StrictHostKeyChecking=no",
        "-o", "UserKnownHostsFile=/dev/null",
        "-o", "LogLevel=ERROR",
        "-p", std::to_string(port),
    };
    if (!user.empty()) {
        req.argv.push_back("-l");
        req.argv.push_back(user);
    }
    // "--" keeps a host starting with '-' from being read as an option
    req.argv.push_back("--");
    req.argv.push_back(host);
    req.argv.push_back("true");
    req.timeout = std::chrono::seconds(timeout_s + 2);
    req.max_output = max_output_;

    auto outcome = run_process(req);
    if (auto* failure = std::get_if<ToolFailure>(&outcome)) {
        return {
            {"status", failure->kind == ErrorKind::Timeout ? "probe_timeout" : "probe_unavailable"},
            {"detail", failure->message},
        };
    }

    const auto& result = std::get<ExecResult>(outcome);
    nlohmann::json probe = {
        {"status", classify_auth_probe(result)},
        {"exit_code", result.exit_code},
        {"elapsed_ms", result.elapsed_ms},
    };
    std::string detail = trim(result.stderr_data);
    if (!detail.empty()) probe["detail"] = detail;
    return probe;
}

} // namespace sshmcp
