#pragma once
#include "../tool.hpp"
#include "../ssh_key.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sshmcp {

struct KeyScanEntry {
    std::string name;
    std::string path;
    uint32_t mode = 0;                  // permission bits
    std::optional<KeyInfo> info;        // set when the file was read and classified
    std::optional<ToolFailure> error;   // set when it could not be
};

// Non-recursive scan of a key directory. Files that are readable but not
// keys are left out; unreadable candidates come back with `error` set.
// Fails as a whole only when the directory itself cannot be listed.
std::variant<std::vector<KeyScanEntry>, ToolFailure>
scan_key_directory(const std::string& directory);

// Private keys must not be accessible by group/other; public keys must not
// be writable by them.
bool key_permissions_ok(const KeyScanEntry& entry);

nlohmann::json key_entry_json(const KeyScanEntry& entry);

class ListKeysTool : public Tool {
public:
    explicit ListKeysTool(const Config& cfg);

    const ToolDescriptor& descriptor() const override { return descriptor_; }
    ToolResult execute(const nlohmann::json& args) override;

private:
    ToolDescriptor descriptor_;
};

} // namespace sshmcp
