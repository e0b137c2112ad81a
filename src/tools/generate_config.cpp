#include "generate_config.hpp"
#include "tool_util.hpp"
#include "../config.hpp"
#include "../process.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace sshmcp {

namespace {

bool has_control(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        return std::iscntrl(static_cast<unsigned char>(c)) != 0;
    });
}

bool has_space(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

// A single token of the config grammar: no whitespace, no comment start,
// no quoting, no key/value separator.
std::optional<ToolFailure> check_token(const char* field, const std::string& value,
                                       const std::string& extra_forbidden) {
    if (value.empty()) {
        return ToolFailure{ErrorKind::InvalidInput, std::string(field) + " must not be empty"};
    }
    if (has_control(value) || has_space(value)) {
        return ToolFailure{ErrorKind::InvalidInput,
                           std::string(field) + " must not contain whitespace or control characters"};
    }
    std::string forbidden = "#\"'=" + extra_forbidden;
    if (value.find_first_of(forbidden) != std::string::npos) {
        return ToolFailure{ErrorKind::InvalidInput,
                           std::string(field) + " contains a character not allowed in ssh_config: " + value};
    }
    return std::nullopt;
}

// Lowercased keys that would start a new block or pull in other files
bool is_structural_key(const std::string& key) {
    return key == "host" || key == "match" || key == "include";
}

} // namespace

std::optional<ToolFailure> render_host_stanza(const HostStanza& stanza, std::string& out) {
    if (auto err = check_token("alias", stanza.alias, "")) return err;
    if (auto err = check_token("host", stanza.host, ",*?!")) return err;
    if (auto err = check_token("user", stanza.user, "")) return err;
    if (stanza.port < 1 || stanza.port > 65535) {
        return ToolFailure{ErrorKind::InvalidInput, "port must be between 1 and 65535"};
    }
    if (has_control(stanza.identity_file) ||
        stanza.identity_file.find('"') != std::string::npos) {
        return ToolFailure{ErrorKind::InvalidInput,
                           "identity_file must not contain quotes or control characters"};
    }

    std::string text = "Host " + stanza.alias + "\n";
    text += "    HostName " + stanza.host + "\n";
    text += "    User " + stanza.user + "\n";
    text += "    Port " + std::to_string(stanza.port) + "\n";
    if (!stanza.identity_file.empty()) {
        if (has_space(stanza.identity_file)) {
            text += "    IdentityFile \"" + stanza.identity_file + "\"\n";
        } else {
            text += "    IdentityFile " + stanza.identity_file + "\n";
        }
    }

    if (stanza.keep_alive) {
        text += "    ServerAliveInterval 60\n";
        text += "    ServerAliveCountMax 3\n";
    }

    std::vector<std::string> seen = {"hostname", "user", "port"};
    if (!stanza.identity_file.empty()) seen.push_back("identityfile");
    if (stanza.keep_alive) {
        seen.push_back("serveraliveinterval");
        seen.push_back("serveralivecountmax");
    }

    for (const auto& option : stanza.extra_options) {
        if (has_control(option)) {
            return ToolFailure{ErrorKind::InvalidInput,
                               "extra option must not contain control characters: " + option};
        }
        std::string trimmed = trim(option);
        size_t sep = trimmed.find_first_of(" \t=");
        if (sep == std::string::npos) {
            return ToolFailure{ErrorKind::InvalidInput,
                               "extra option must be 'Key Value' or 'Key=Value': " + option};
        }
        std::string key = trimmed.substr(0, sep);
        std::string value = trim(trimmed.substr(sep + 1));
        if (!value.empty() && value[0] == '=' && trimmed[sep] != '=') {
            value = trim(value.substr(1));
        }
        if (key.empty() || !std::all_of(key.begin(), key.end(), [](char c) {
                return std::isalpha(static_cast<unsigned char>(c)) != 0;
            })) {
            return ToolFailure{ErrorKind::InvalidInput, "invalid option keyword: " + key};
        }
        if (value.empty()) {
            return ToolFailure{ErrorKind::InvalidInput, "option " + key + " has no value"};
        }
        std::string lower = to_lower(key);
        if (is_structural_key(lower)) {
            return ToolFailure{ErrorKind::InvalidInput,
                               key + " cannot be used inside a generated Host stanza"};
        }
        if (std::find(seen.begin(), seen.end(), lower) != seen.end()) {
            return ToolFailure{ErrorKind::InvalidInput, "duplicate option: " + key};
        }
        seen.push_back(lower);
        text += "    " + key + " " + value + "\n";
    }

    out = std::move(text);
    return std::nullopt;
}

GenerateConfigTool::GenerateConfigTool(const Config& cfg)
    : ssh_binary_(cfg.ssh.binary)
    , max_output_(cfg.limits.max_output_bytes)
{
    descriptor_.name = "generate_ssh_config";
    descriptor_.description =
        "Generate a Host stanza for ~/.ssh/config. Output is deterministic; "
        "optionally checks the stanza with `ssh -G`.";
    descriptor_.params = {
        string_param("alias", "Host alias used on the ssh command line", true),
        string_param("host", "Real hostname or IP address (HostName)", true),
        string_param("user", "Remote user name", true),
        int_param("port", "SSH port", false, 22, 1, 65535),
        string_param("identity_file", "Private key path for IdentityFile", false),
        string_list_param("extra_options",
                          "Additional options, each 'Key Value', emitted in the given order"),
        bool_param("keep_alive", "Add ServerAliveInterval 60 and ServerAliveCountMax 3", false),
        bool_param("validate", "Parse the stanza with the local ssh client (ssh -G)", false),
    };
}

ToolResult GenerateConfigTool::execute(const nlohmann::json& args) {
    HostStanza stanza;
    stanza.alias = arg_string(args, "alias");
    stanza.host = arg_string(args, "host");
    stanza.user = arg_string(args, "user");
    stanza.port = arg_int(args, "port", 22);
    stanza.identity_file = arg_string(args, "identity_file");
    stanza.keep_alive = arg_bool(args, "keep_alive", false);
    if (args.contains("extra_options")) {
        stanza.extra_options = args["extra_options"].get<std::vector<std::string>>();
    }

    std::string text;
    if (auto err = render_host_stanza(stanza, text)) {
        return ToolResult::failure(err->kind, err->message);
    }

    nlohmann::json payload = {
        {"alias", stanza.alias},
        {"config", text},
        {"line_count", std::count(text.begin(), text.end(), '\n')},
    };
    if (arg_bool(args, "validate", false)) {
        payload["validation"] = validate_with_ssh(stanza.alias, text);
    }
    return ToolResult::success(std::move(payload));
}

nlohmann::json GenerateConfigTool::validate_with_ssh(const std::string& alias,
                                                     const std::string& text) const {
    auto tmpl = (std::filesystem::temp_directory_path() / "sshmcp_config_XXXXXX").string();
    int fd = ::mkstemp(tmpl.data());
    if (fd < 0) {
        return {{"ok", false}, {"detail", "could not create a temporary config file"}};
    }

    // Removes the temp file on every return path
    struct TempFile {
        std::string path;
        ~TempFile() { ::unlink(path.c_str()); }
    } temp{tmpl};

    size_t written = 0;
    while (written < text.size()) {
        ssize_t n = ::write(fd, text.data() + written, text.size() - written);
        if (n <= 0) break;
        written += static_cast<size_t>(n);
    }
    ::close(fd);
    if (written != text.size()) {
        return {{"ok", false}, {"detail", "could not write the temporary config file"}};
    }

    ExecRequest req;
    req.argv = {ssh_binary_, "-G", "-F", temp.path, "--", alias};
    req.timeout = std::chrono::seconds(5);
    req.max_output = max_output_;

    auto outcome = run_process(req);
    if (auto* failure = std::get_if<ToolFailure>(&outcome)) {
        return {{"ok", false}, {"detail", failure->message}};
    }
    const auto& result = std::get<ExecResult>(outcome);
    nlohmann::json validation = {
        {"ok", result.exit_code == 0},
        {"exit_code", result.exit_code},
    };
    std::string detail = trim(result.stderr_data);
    if (!detail.empty()) validation["detail"] = detail;
    return validation;
}

} // namespace sshmcp
