#include "list_keys.hpp"
#include "tool_util.hpp"
#include "../config.hpp"
#include "../util.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace sshmcp {

namespace {

constexpr uintmax_t kMaxKeyFileSize = 256 * 1024;

bool is_ignored_name(const std::string& name) {
    static const char* const prefixes[] = {"known_hosts", "authorized_keys"};
    for (const char* p : prefixes) {
        if (starts_with(name, p)) return true;
    }
    std::string base = ends_with(name, ".old") ? name.substr(0, name.size() - 4) : name;
    return base == "config" || base == "environment" || base == "rc" ||
           name == ".DS_Store";
}

const char* kind_name(KeyFileKind kind) {
    switch (kind) {
        case KeyFileKind::PublicKey:  return "public";
        case KeyFileKind::PrivateKey: return "private";
        case KeyFileKind::NotAKey:    break;
    }
    return "none";
}

// Legacy PEM keys carry no public half; borrow it from "<name>.pub"
void fill_from_sibling(const std::string& path, KeyInfo& info) {
    std::string contents;
    if (read_text_file(path + ".pub", contents)) return;
    try {
        KeyInfo pub = inspect_key_file(path + ".pub", contents);
        if (pub.kind != KeyFileKind::PublicKey) return;
        info.fingerprint = pub.fingerprint;
        info.bits = pub.bits;
        if (info.algorithm.empty()) info.algorithm = pub.algorithm;
        if (info.type.empty() || info.type == "unknown") info.type = pub.type;
    } catch (const std::invalid_argument&) { // NOLINT(bugprone-empty-catch)
        // Sibling is corrupt; the private key entry stays without a fingerprint
    }
}

std::optional<KeyScanEntry> scan_entry(const fs::directory_entry& dirent) {
    KeyScanEntry entry;
    entry.name = dirent.path().filename().string();
    entry.path = dirent.path().string();

    struct stat st{};
    if (::stat(entry.path.c_str(), &st) != 0) {
        std::error_code ec(errno, std::generic_category());
        entry.error = ToolFailure{error_kind_for(ec), "stat failed: " + ec.message()};
        return entry;
    }
    if (!S_ISREG(st.st_mode)) return std::nullopt;
    entry.mode = static_cast<uint32_t>(st.st_mode) & 07777;
    if (static_cast<uintmax_t>(st.st_size) > kMaxKeyFileSize) return std::nullopt;

    std::string contents;
    if (auto err = read_text_file(entry.path, contents)) {
        entry.error = *err;
        return entry;
    }

    try {
        KeyInfo info = inspect_key_file(entry.name, contents);
        if (info.kind == KeyFileKind::NotAKey) return std::nullopt;
        if (info.kind == KeyFileKind::PrivateKey && info.fingerprint.empty()) {
            fill_from_sibling(entry.path, info);
        }
        entry.info = std::move(info);
    } catch (const std::invalid_argument& e) {
        entry.error = ToolFailure{ErrorKind::InvalidInput,
                                  std::string("unreadable key data: ") + e.what()};
    }
    return entry;
}

} // namespace

std::variant<std::vector<KeyScanEntry>, ToolFailure>
scan_key_directory(const std::string& directory) {
    std::error_code ec;
    auto status = fs::status(directory, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return ToolFailure{error_kind_for(ec), "Cannot access " + directory + ": " + ec.message()};
    }
    if (!fs::exists(status)) {
        return ToolFailure{ErrorKind::NotFound, "Directory not found: " + directory};
    }
    if (!fs::is_directory(status)) {
        return ToolFailure{ErrorKind::NotFound, "Not a directory: " + directory};
    }

    fs::directory_iterator it(directory, ec);
    if (ec) {
        return ToolFailure{error_kind_for(ec), "Cannot list " + directory + ": " + ec.message()};
    }

    std::vector<fs::directory_entry> dirents;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return ToolFailure{error_kind_for(ec), "Cannot list " + directory + ": " + ec.message()};
        }
        dirents.push_back(*it);
    }
    std::sort(dirents.begin(), dirents.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    std::vector<KeyScanEntry> entries;
    for (const auto& dirent : dirents) {
        if (is_ignored_name(dirent.path().filename().string())) continue;
        if (auto entry = scan_entry(dirent)) entries.push_back(std::move(*entry));
    }
    return entries;
}

bool key_permissions_ok(const KeyScanEntry& entry) {
    if (!entry.info) return true;
    if (entry.info->kind == KeyFileKind::PrivateKey) return (entry.mode & 077) == 0;
    return (entry.mode & 022) == 0;
}

nlohmann::json key_entry_json(const KeyScanEntry& entry) {
    nlohmann::json j = {
        {"name", entry.name},
        {"path", entry.path},
    };
    if (entry.mode != 0 || entry.info) j["mode"] = format_mode(entry.mode);
    if (entry.error) {
        j["error"] = failure_json(*entry.error);
        return j;
    }

    const KeyInfo& info = *entry.info;
    j["kind"] = kind_name(info.kind);
    j["is_private"] = info.kind == KeyFileKind::PrivateKey;
    j["type"] = info.type.empty() ? "unknown" : info.type;
    j["format"] = info.format;
    if (!info.algorithm.empty()) j["algorithm"] = info.algorithm;
    if (info.bits != 0) j["bits"] = info.bits;
    j["fingerprint"] = info.fingerprint.empty() ? nlohmann::json(nullptr)
                                                : nlohmann::json(info.fingerprint);
    if (!info.comment.empty()) j["comment"] = info.comment;
    if (info.kind == KeyFileKind::PrivateKey) j["encrypted"] = info.encrypted;
    j["permissions_ok"] = key_permissions_ok(entry);
    return j;
}

ListKeysTool::ListKeysTool(const Config& cfg) {
    descriptor_.name = "list_ssh_keys";
    descriptor_.description =
        "List SSH keys in a directory (non-recursive): type, size, SHA256 fingerprint, "
        "private/public and file permissions. Unreadable files are reported per entry.";
    descriptor_.params = {
        defaulted_string_param("directory", "Key directory to scan", cfg.ssh.key_directory),
    };
}

ToolResult ListKeysTool::execute(const nlohmann::json& args) {
    std::string directory = expand_home(arg_string(args, "directory", "~/.ssh"));

    auto scan = scan_key_directory(directory);
    if (auto* failure = std::get_if<ToolFailure>(&scan)) {
        return ToolResult::failure(failure->kind, failure->message);
    }

    const auto& entries = std::get<std::vector<KeyScanEntry>>(scan);
    nlohmann::json keys = nlohmann::json::array();
    size_t failed = 0;
    for (const auto& entry : entries) {
        if (entry.error) failed++;
        keys.push_back(key_entry_json(entry));
    }

    return ToolResult::success({
        {"directory", directory},
        {"count", entries.size()},
        {"failed", failed},
        {"keys", std::move(keys)},
    });
}

} // namespace sshmcp
