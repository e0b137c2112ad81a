#pragma once
#include "../tool.hpp"
#include "../ssh_config_file.hpp"
#include <string>
#include <vector>

namespace sshmcp {

// Directives grouped by the Host or Match line that opens their block.
// Directives before the first block form a "global" block with line 0.
struct ConfigBlock {
    std::string kind;                   // global | host | match
    std::vector<std::string> patterns;  // Host patterns, or Match criteria words
    size_t line = 0;
    std::vector<ConfigDirective> options;
};

std::vector<ConfigBlock> group_config_blocks(const std::vector<ConfigDirective>& directives);

class CheckConfigTool : public Tool {
public:
    explicit CheckConfigTool(const Config& cfg);

    const ToolDescriptor& descriptor() const override { return descriptor_; }
    ToolResult execute(const nlohmann::json& args) override;

private:
    nlohmann::json describe_key_directory() const;

    ToolDescriptor descriptor_;
    std::string client_config_;
    std::string key_directory_;
};

} // namespace sshmcp
