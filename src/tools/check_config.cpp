#include "check_config.hpp"
#include "tool_util.hpp"
#include "../config.hpp"
#include "../util.hpp"

#include <algorithm>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace sshmcp {

namespace {

constexpr off_t kMaxConfigSize = 1024 * 1024;

std::vector<std::string> split_words(const std::string& value) {
    std::vector<std::string> words;
    std::string current;
    for (char c : value) {
        if (c == ' ' || c == '\t') {
            if (!current.empty()) words.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

nlohmann::json block_json(const ConfigBlock& block) {
    nlohmann::json options = nlohmann::json::array();
    for (const auto& d : block.options) {
        options.push_back({{"keyword", d.keyword}, {"value", d.value}, {"line", d.line}});
    }
    nlohmann::json j = {{"kind", block.kind}, {"line", block.line}, {"options", options}};
    if (block.kind != "global") j["patterns"] = block.patterns;
    return j;
}

} // namespace

std::vector<ConfigBlock> group_config_blocks(const std::vector<ConfigDirective>& directives) {
    std::vector<ConfigBlock> blocks;
    ConfigBlock global;
    global.kind = "global";

    ConfigBlock* current = &global;
    for (const auto& d : directives) {
        if (d.keyword == "host" || d.keyword == "match") {
            ConfigBlock block;
            block.kind = d.keyword;
            block.patterns = split_words(d.value);
            block.line = d.line;
            blocks.push_back(std::move(block));
            current = &blocks.back();
            continue;
        }
        current->options.push_back(d);
    }

    if (!global.options.empty()) blocks.insert(blocks.begin(), std::move(global));
    return blocks;
}

CheckConfigTool::CheckConfigTool(const Config& cfg)
    : client_config_(cfg.ssh.client_config)
    , key_directory_(cfg.ssh.key_directory)
{
    descriptor_.name = "check_ssh_config";
    descriptor_.description =
        "Summarize the SSH client config: Host and Match blocks with their options, "
        "file permissions, and the files in the key directory.";
    descriptor_.params = {
        defaulted_string_param("config_file", "Client config path (~ is expanded)",
                               cfg.ssh.client_config),
    };
}

ToolResult CheckConfigTool::execute(const nlohmann::json& args) {
    std::string shown = arg_string(args, "config_file", client_config_);
    std::string path = expand_home(shown);

    nlohmann::json payload = {{"config_file", shown}, {"path", path}};

    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        std::error_code ec(errno, std::generic_category());
        if (ec != std::errc::no_such_file_or_directory) {
            return ToolResult::failure(error_kind_for(ec), "Cannot stat " + path + ": " + ec.message());
        }
        payload["exists"] = false;
        payload["blocks"] = nlohmann::json::array();
        payload["host_count"] = 0;
        payload["key_directory"] = describe_key_directory();
        return ToolResult::success(std::move(payload));
    }
    if (!S_ISREG(st.st_mode)) {
        return ToolResult::failure(ErrorKind::InvalidInput, path + " is not a regular file");
    }
    if (st.st_size > kMaxConfigSize) {
        return ToolResult::failure(ErrorKind::InvalidInput, path + " is too large to be an ssh config");
    }

    std::string contents;
    if (auto err = read_text_file(path, contents)) {
        return ToolResult::failure(err->kind, err->message);
    }

    uint32_t mode = static_cast<uint32_t>(st.st_mode) & 07777;
    auto directives = parse_ssh_config(contents);
    auto blocks = group_config_blocks(directives);

    nlohmann::json blocks_json = nlohmann::json::array();
    size_t hosts = 0;
    for (const auto& block : blocks) {
        if (block.kind == "host") ++hosts;
        blocks_json.push_back(block_json(block));
    }

    payload["exists"] = true;
    payload["mode"] = format_mode(mode);
    // ssh refuses a config writable by group or other
    payload["permissions_ok"] = (mode & 022) == 0;
    payload["directive_count"] = directives.size();
    payload["blocks"] = std::move(blocks_json);
    payload["host_count"] = hosts;
    payload["key_directory"] = describe_key_directory();
    return ToolResult::success(std::move(payload));
}

nlohmann::json CheckConfigTool::describe_key_directory() const {
    std::string dir = expand_home(key_directory_);
    nlohmann::json result = {{"path", dir}};

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        result["exists"] = false;
        result["files"] = nlohmann::json::array();
        return result;
    }
    result["exists"] = true;

    std::vector<std::string> names;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        result["files"] = nlohmann::json::array();
        result["error"] = failure_json(
            ToolFailure{error_kind_for(ec), "Cannot list " + dir + ": " + ec.message()});
        return result;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());

    nlohmann::json files = nlohmann::json::array();
    for (const auto& name : names) {
        struct stat st{};
        std::string full = (fs::path(dir) / name).string();
        if (::stat(full.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;
        files.push_back({
            {"name", name},
            {"size", static_cast<uint64_t>(st.st_size)},
            {"mode", format_mode(static_cast<uint32_t>(st.st_mode) & 07777)},
        });
    }
    result["files"] = std::move(files);
    return result;
}

} // namespace sshmcp
