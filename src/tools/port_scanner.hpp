#pragma once
#include "../tool.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sshmcp {

// Parse "22", "20-25", "22,80,8000-8010" into sorted unique ports.
// Blank input and reversed ranges contribute no ports. Malformed tokens
// or ports outside 1..65535 produce an InvalidInput failure.
std::optional<ToolFailure> parse_port_range(const std::string& spec,
                                            std::vector<uint16_t>& ports);

class PortScannerTool : public Tool {
public:
    explicit PortScannerTool(const Config& cfg);

    const ToolDescriptor& descriptor() const override { return descriptor_; }
    ToolResult execute(const nlohmann::json& args) override;

private:
    ToolDescriptor descriptor_;
    uint32_t max_ports_;
    uint32_t max_concurrency_;
};

} // namespace sshmcp
