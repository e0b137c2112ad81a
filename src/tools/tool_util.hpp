#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

namespace sshmcp {

// Accessors for validated arguments. Optional params without a default
// may be absent; these return the fallback in that case.
inline std::string arg_string(const nlohmann::json& args, const char* field,
                              const std::string& fallback = "") {
    auto it = args.find(field);
    if (it == args.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

inline int64_t arg_int(const nlohmann::json& args, const char* field, int64_t fallback) {
    auto it = args.find(field);
    if (it == args.end() || !it->is_number_integer()) return fallback;
    return it->get<int64_t>();
}

inline bool arg_bool(const nlohmann::json& args, const char* field, bool fallback) {
    auto it = args.find(field);
    if (it == args.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

// Map an errno/error_code from filesystem access to a typed failure kind
inline ErrorKind error_kind_for(const std::error_code& ec) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ErrorKind::PermissionDenied;
    }
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return ErrorKind::NotFound;
    }
    return ErrorKind::InternalError;
}

// Read a whole file. Returns a typed failure instead of throwing.
inline std::optional<ToolFailure> read_text_file(const std::string& path, std::string& out) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec(errno ? errno : ENOENT, std::generic_category());
        return ToolFailure{error_kind_for(ec), "Failed to open " + path + ": " + ec.message()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return ToolFailure{ErrorKind::InternalError, "Failed to read " + path};
    }
    out = ss.str();
    return std::nullopt;
}

inline nlohmann::json failure_json(const ToolFailure& failure) {
    return {{"kind", error_kind_name(failure.kind)}, {"message", failure.message}};
}

} // namespace sshmcp
