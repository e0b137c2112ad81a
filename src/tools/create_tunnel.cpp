#include "create_tunnel.hpp"
#include "tool_util.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cctype>

namespace sshmcp {

namespace {

ToolFailure bad_input(std::string message) {
    return ToolFailure{ErrorKind::InvalidInput, std::move(message)};
}

bool plain_word(const std::string& s) {
    return std::none_of(s.begin(), s.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return std::iscntrl(u) != 0 || std::isspace(u) != 0;
    });
}

// A word ssh must not read as an option or split into user@host
std::optional<ToolFailure> check_word(const char* field, const std::string& value,
                                      const std::string& forbidden) {
    if (value.empty()) return bad_input(std::string(field) + " must not be empty");
    if (value[0] == '-') return bad_input(std::string(field) + " must not start with '-'");
    if (!plain_word(value)) {
        return bad_input(std::string(field) + " must not contain whitespace or control characters");
    }
    if (value.find_first_of(forbidden) != std::string::npos) {
        return bad_input(std::string(field) + " contains a character ssh would misread: " + value);
    }
    return std::nullopt;
}

std::string endpoint(const std::string& host, int64_t port) {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return h + ":" + std::to_string(port);
}

} // namespace

std::optional<ToolFailure> plan_tunnel(const TunnelRequest& request, TunnelPlan& plan) {
    if (request.type != "local" && request.type != "remote" && request.type != "dynamic") {
        return bad_input("unsupported tunnel type: " + request.type);
    }
    if (request.local_port < 1 || request.local_port > 65535) {
        return bad_input("local_port must be between 1 and 65535");
    }
    if (request.ssh_port < 1 || request.ssh_port > 65535) {
        return bad_input("ssh_port must be between 1 and 65535");
    }
    if (auto err = check_word("ssh_server", request.ssh_server, "@/")) return err;
    if (!request.user.empty()) {
        if (auto err = check_word("user", request.user, "@:/")) return err;
    }

    TunnelPlan result;
    std::string flag;
    std::string local = std::to_string(request.local_port);

    if (request.type == "dynamic") {
        flag = "-D";
        result.forward = local;
        result.description = "SOCKS proxy on localhost:" + local + " through " + request.ssh_server;
    } else {
        if (request.remote_host.empty()) {
            return bad_input("remote_host is required for a " + request.type + " tunnel");
        }
        if (auto err = check_word("remote_host", request.remote_host, "@/[]")) return err;
        if (!request.remote_port) {
            return bad_input("remote_port is required for a " + request.type + " tunnel");
        }
        if (*request.remote_port < 1 || *request.remote_port > 65535) {
            return bad_input("remote_port must be between 1 and 65535");
        }
        std::string target = endpoint(request.remote_host, *request.remote_port);
        result.forward = local + ":" + target;
        if (request.type == "local") {
            flag = "-L";
            result.description = "localhost:" + local + " -> " + request.ssh_server + " -> " + target;
        } else {
            flag = "-R";
            result.description = request.ssh_server + ":" + local + " -> this machine -> " + target;
        }
    }

    std::string destination = request.user.empty()
        ? request.ssh_server : request.user + "@" + request.ssh_server;

    result.argv = {"ssh"};
    if (request.ssh_port != 22) {
        result.argv.push_back("-p");
        result.argv.push_back(std::to_string(request.ssh_port));
    }
    result.argv.push_back("-N");
    result.argv.push_back(flag);
    result.argv.push_back(result.forward);
    result.argv.push_back(destination);

    result.background_argv = result.argv;
    result.background_argv.insert(result.background_argv.begin() + 1, "-f");

    plan = std::move(result);
    return std::nullopt;
}

CreateTunnelTool::CreateTunnelTool(const Config& /*cfg*/) {
    descriptor_.name = "create_ssh_tunnel";
    descriptor_.description =
        "Build the ssh command for a local (-L), remote (-R) or dynamic SOCKS (-D) "
        "port forward. The command is returned, not run.";
    descriptor_.params = {
        enum_param("tunnel_type", "Forwarding mode", {"local", "remote", "dynamic"}, "local"),
        int_param("local_port", "Listening port (on this machine for local/dynamic, "
                                "on the server for remote)", true, std::nullopt, 1, 65535),
        string_param("remote_host", "Destination host for local/remote tunnels", false),
        int_param("remote_port", "Destination port for local/remote tunnels",
                  false, std::nullopt, 1, 65535),
        string_param("ssh_server", "SSH server that carries the tunnel", true),
        string_param("user", "Login user on the SSH server", false),
        int_param("ssh_port", "SSH server port", false, 22, 1, 65535),
    };
}

ToolResult CreateTunnelTool::execute(const nlohmann::json& args) {
    TunnelRequest request;
    request.type = arg_string(args, "tunnel_type", "local");
    request.local_port = arg_int(args, "local_port", 0);
    request.remote_host = arg_string(args, "remote_host");
    if (args.contains("remote_port")) request.remote_port = arg_int(args, "remote_port", 0);
    request.ssh_server = arg_string(args, "ssh_server");
    request.user = arg_string(args, "user");
    request.ssh_port = arg_int(args, "ssh_port", 22);

    TunnelPlan plan;
    if (auto err = plan_tunnel(request, plan)) {
        return ToolResult::failure(err->kind, err->message);
    }

    return ToolResult::success({
        {"tunnel_type", request.type},
        {"forward", plan.forward},
        {"argv", plan.argv},
        {"command", shell_join(plan.argv)},
        {"background_command", shell_join(plan.background_argv)},
        {"description", plan.description},
    });
}

} // namespace sshmcp
