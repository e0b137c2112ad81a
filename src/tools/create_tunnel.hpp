#pragma once
#include "../tool.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sshmcp {

struct TunnelRequest {
    std::string type = "local";   // local | remote | dynamic
    int64_t local_port = 0;
    std::string remote_host;      // local and remote only
    std::optional<int64_t> remote_port;
    std::string ssh_server;
    std::string user;             // empty = ssh's default
    int64_t ssh_port = 22;
};

struct TunnelPlan {
    std::string forward;          // argument of -L/-R/-D
    std::vector<std::string> argv;
    std::vector<std::string> background_argv;
    std::string description;
};

// Build the ssh port-forwarding command. Nothing is executed.
std::optional<ToolFailure> plan_tunnel(const TunnelRequest& request, TunnelPlan& plan);

class CreateTunnelTool : public Tool {
public:
    explicit CreateTunnelTool(const Config& cfg);

    const ToolDescriptor& descriptor() const override { return descriptor_; }
    ToolResult execute(const nlohmann::json& args) override;

private:
    ToolDescriptor descriptor_;
};

} // namespace sshmcp
