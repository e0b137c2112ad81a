#pragma once
#include "../tool.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sshmcp {

struct HostStanza {
    std::string alias;
    std::string host;
    std::string user;
    int64_t port = 22;
    std::string identity_file;               // empty = omitted
    bool keep_alive = false;                 // ServerAliveInterval 60 / CountMax 3
    std::vector<std::string> extra_options;  // "Key Value" or "Key=Value"
};

// Render a Host stanza for ssh_config(5). Same input, same bytes.
// Returns InvalidInput when a field cannot be expressed in the grammar.
std::optional<ToolFailure> render_host_stanza(const HostStanza& stanza, std::string& out);

class GenerateConfigTool : public Tool {
public:
    explicit GenerateConfigTool(const Config& cfg);

    const ToolDescriptor& descriptor() const override { return descriptor_; }
    ToolResult execute(const nlohmann::json& args) override;

private:
    nlohmann::json validate_with_ssh(const std::string& alias, const std::string& text) const;

    ToolDescriptor descriptor_;
    std::string ssh_binary_;
    size_t max_output_;
};

} // namespace sshmcp
