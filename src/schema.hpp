#pragma once
#include "tool.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sshmcp {

// Check args against the descriptor and build the normalized argument
// object the handler sees: defaults filled in, values coerced to their
// declared type, undeclared keys dropped (their names land in `ignored`).
// Returns a failure (always InvalidArguments) instead of touching `out`
// when anything does not fit.
std::optional<ToolFailure> validate_arguments(const ToolDescriptor& descriptor,
                                              const nlohmann::json& args,
                                              nlohmann::json& out,
                                              std::vector<std::string>* ignored = nullptr);

// JSON Schema ("type":"object") advertised as inputSchema in tools/list
nlohmann::json input_schema_json(const ToolDescriptor& descriptor);

} // namespace sshmcp
