#include "generate_key.hpp"
#include "tool_util.hpp"
#include "../config.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace sshmcp {

namespace {

bool has_control(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        return std::iscntrl(static_cast<unsigned char>(c)) != 0;
    });
}

ToolFailure bad_input(std::string message) {
    return ToolFailure{ErrorKind::InvalidInput, std::move(message)};
}

std::optional<ToolFailure> check_filename(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return bad_input("filename must name a file: '" + name + "'");
    }
    if (name.find('/') != std::string::npos) {
        return bad_input("filename must not contain '/'; keys are written to the key directory");
    }
    if (name[0] == '-' || has_control(name)) {
        return bad_input("filename must not start with '-' or contain control characters");
    }
    if (ends_with(name, ".pub")) {
        return bad_input("filename names the private key; ssh-keygen adds .pub itself");
    }
    return std::nullopt;
}

} // namespace

std::optional<ToolFailure> plan_keygen(const KeygenRequest& request, KeygenPlan& plan) {
    KeygenPlan result;
    result.key_type = request.key_type;

    if (request.key_type == "ed25519") {
        // Fixed size; a requested size is ignored
        result.bits = 256;
    } else if (request.key_type == "rsa") {
        result.bits = request.bits.value_or(4096);
        if (result.bits < 2048) {
            return bad_input("RSA keys below 2048 bits are rejected as weak (got " +
                             std::to_string(result.bits) + ")");
        }
        if (result.bits > 16384) {
            return bad_input("RSA key size above 16384 bits is not supported by ssh-keygen");
        }
    } else if (request.key_type == "ecdsa") {
        result.bits = request.bits.value_or(256);
        if (result.bits != 256 && result.bits != 384 && result.bits != 521) {
            return bad_input("ECDSA key size must be 256, 384 or 521 (got " +
                             std::to_string(result.bits) + ")");
        }
    } else {
        return bad_input("unsupported key type: " + request.key_type);
    }

    if (has_control(request.comment)) {
        return bad_input("comment must not contain control characters");
    }
    std::string filename = request.filename.empty() ? "id_" + request.key_type : request.filename;
    if (auto err = check_filename(filename)) return err;

    result.private_key_path = (fs::path(request.directory) / filename).string();
    result.public_key_path = result.private_key_path + ".pub";

    result.argv = {"ssh-keygen", "-t", request.key_type};
    if (request.key_type != "ed25519") {
        result.argv.push_back("-b");
        result.argv.push_back(std::to_string(result.bits));
    }
    if (!request.comment.empty()) {
        result.argv.push_back("-C");
        result.argv.push_back(request.comment);
    }
    result.argv.push_back("-f");
    result.argv.push_back(result.private_key_path);

    plan = std::move(result);
    return std::nullopt;
}

GenerateKeyTool::GenerateKeyTool(const Config& cfg)
    : key_directory_(cfg.ssh.key_directory)
{
    descriptor_.name = "generate_ssh_key";
    descriptor_.description =
        "Prepare the ssh-keygen command for a new key pair. The command is returned, "
        "not run, so the passphrase prompt stays with the user.";
    descriptor_.params = {
        enum_param("key_type", "Key algorithm", {"ed25519", "rsa", "ecdsa"}, "ed25519"),
        int_param("key_size", "Key size in bits (rsa: default 4096; ecdsa: 256, 384 or 521)",
                  false, std::nullopt, 256, 16384),
        string_param("comment", "Key comment, e.g. user@host", false),
        string_param("filename", "Private key file name inside the key directory "
                                 "(default id_<key_type>)", false),
    };
}

ToolResult GenerateKeyTool::execute(const nlohmann::json& args) {
    KeygenRequest request;
    request.key_type = arg_string(args, "key_type", "ed25519");
    if (args.contains("key_size")) request.bits = arg_int(args, "key_size", 0);
    request.comment = arg_string(args, "comment");
    request.filename = arg_string(args, "filename");
    request.directory = expand_home(key_directory_);

    KeygenPlan plan;
    if (auto err = plan_keygen(request, plan)) {
        return ToolResult::failure(err->kind, err->message);
    }

    std::error_code ec;
    bool exists = fs::exists(plan.private_key_path, ec) || fs::exists(plan.public_key_path, ec);

    nlohmann::json payload = {
        {"key_type", plan.key_type},
        {"bits", plan.bits},
        {"private_key_path", plan.private_key_path},
        {"public_key_path", plan.public_key_path},
        {"argv", plan.argv},
        {"command", shell_join(plan.argv)},
        {"exists", exists},
    };
    if (exists) {
        payload["warning"] = "a key already exists at this path; ssh-keygen will ask before overwriting it";
    }
    return ToolResult::success(std::move(payload));
}

} // namespace sshmcp
