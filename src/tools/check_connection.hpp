#pragma once
#include "../tool.hpp"
#include "../process.hpp"
#include <string>

namespace sshmcp {

// Maps a finished `ssh -T BatchMode` run to an auth_stage_result status
std::string classify_auth_probe(const ExecResult& result);

class CheckConnectionTool : public Tool {
public:
    explicit CheckConnectionTool(const Config& cfg);

    const ToolDescriptor& descriptor() const override { return descriptor_; }
    ToolResult execute(const nlohmann::json& args) override;

private:
    nlohmann::json run_auth_probe(const std::string& host, int64_t port,
                                  const std::string& user, int64_t timeout_s) const;

    ToolDescriptor descriptor_;
    std::string ssh_binary_;
    size_t max_output_;
};

} // namespace sshmcp
