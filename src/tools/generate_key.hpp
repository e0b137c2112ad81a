#pragma once
#include "../tool.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sshmcp {

struct KeygenRequest {
    std::string key_type = "ed25519";  // ed25519 | rsa | ecdsa
    std::optional<int64_t> bits;       // rsa and ecdsa only
    std::string comment;
    std::string filename;              // empty = "id_<key_type>"
    std::string directory;             // already ~-expanded
};

struct KeygenPlan {
    std::string key_type;
    int64_t bits = 0;
    std::string private_key_path;
    std::string public_key_path;
    std::vector<std::string> argv;
};

// Work out the ssh-keygen invocation for a request. Nothing is executed.
// InvalidInput for weak or impossible sizes and for file names that are
// not a single path component.
std::optional<ToolFailure> plan_keygen(const KeygenRequest& request, KeygenPlan& plan);

class GenerateKeyTool : public Tool {
public:
    explicit GenerateKeyTool(const Config& cfg);

    const ToolDescriptor& descriptor() const override { return descriptor_; }
    ToolResult execute(const nlohmann::json& args) override;

private:
    ToolDescriptor descriptor_;
    std::string key_directory_;
};

} // namespace sshmcp
