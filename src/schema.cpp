#include "schema.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace sshmcp {

namespace {

ToolFailure invalid(const std::string& detail) {
    return ToolFailure{ErrorKind::InvalidArguments, detail};
}

bool parse_decimal(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    size_t i = 0;
    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = s[0] == '-';
        i = 1;
        if (s.size() == 1) return false;
    }
    if (s.size() - i > 18) return false;
    int64_t value = 0;
    for (; i < s.size(); i++) {
        if (s[i] < '0' || s[i] > '9') return false;
        value = value * 10 + (s[i] - '0');
    }
    out = negative ? -value : value;
    return true;
}

std::optional<ToolFailure> coerce_integer(const ParamSpec& spec,
                                          const nlohmann::json& value,
                                          nlohmann::json& out) {
    int64_t n = 0;
    if (value.is_number_integer()) {
        n = value.get<int64_t>();
    } else if (value.is_number_unsigned()) {
        auto u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return invalid("Parameter '" + spec.name + "' is out of range");
        }
        n = static_cast<int64_t>(u);
    } else if (value.is_number_float()) {
        double d = value.get<double>();
        if (!std::isfinite(d) || std::floor(d) != d ||
            std::fabs(d) > 9.0e15) {
            return invalid("Parameter '" + spec.name + "' must be an integer");
        }
        n = static_cast<int64_t>(d);
    } else if (value.is_string()) {
        if (!parse_decimal(value.get<std::string>(), n)) {
            return invalid("Parameter '" + spec.name + "' must be an integer");
        }
    } else {
        return invalid("Parameter '" + spec.name + "' must be an integer");
    }

    if (spec.minimum && n < *spec.minimum) {
        return invalid("Parameter '" + spec.name + "' must be >= " +
                       std::to_string(*spec.minimum));
    }
    if (spec.maximum && n > *spec.maximum) {
        return invalid("Parameter '" + spec.name + "' must be <= " +
                       std::to_string(*spec.maximum));
    }
    out = n;
    return std::nullopt;
}

std::optional<ToolFailure> coerce_value(const ParamSpec& spec,
                                        const nlohmann::json& value,
                                        nlohmann::json& out) {
    switch (spec.type) {
        case ParamType::String:
            if (!value.is_string()) {
                return invalid("Parameter '" + spec.name + "' must be a string");
            }
            out = value;
            return std::nullopt;

        case ParamType::Integer:
            return coerce_integer(spec, value, out);

        case ParamType::Boolean:
            if (value.is_boolean()) {
                out = value;
                return std::nullopt;
            }
            if (value.is_string()) {
                auto s = value.get<std::string>();
                if (s == "true") { out = true; return std::nullopt; }
                if (s == "false") { out = false; return std::nullopt; }
            }
            return invalid("Parameter '" + spec.name + "' must be a boolean");

        case ParamType::Enum: {
            if (!value.is_string()) {
                return invalid("Parameter '" + spec.name + "' must be a string");
            }
            auto s = value.get<std::string>();
            if (std::find(spec.enum_values.begin(), spec.enum_values.end(), s) ==
                spec.enum_values.end()) {
                std::string allowed;
                for (const auto& v : spec.enum_values) {
                    if (!allowed.empty()) allowed += ", ";
                    allowed += v;
                }
                return invalid("Parameter '" + spec.name + "' must be one of: " + allowed);
            }
            out = s;
            return std::nullopt;
        }

        case ParamType::StringList:
            if (!value.is_array()) {
                return invalid("Parameter '" + spec.name + "' must be an array of strings");
            }
            for (const auto& item : value) {
                if (!item.is_string()) {
                    return invalid("Parameter '" + spec.name + "' must be an array of strings");
                }
            }
            out = value;
            return std::nullopt;
    }
    return invalid("Parameter '" + spec.name + "' has an unsupported type");
}

} // namespace

std::optional<ToolFailure> validate_arguments(const ToolDescriptor& descriptor,
                                              const nlohmann::json& args,
                                              nlohmann::json& out,
                                              std::vector<std::string>* ignored) {
    nlohmann::json input = args.is_null() ? nlohmann::json::object() : args;
    if (!input.is_object()) {
        return invalid("Arguments must be a JSON object");
    }

    nlohmann::json normalized = nlohmann::json::object();
    for (const auto& spec : descriptor.params) {
        auto it = input.find(spec.name);
        // An explicit null is treated as absent
        if (it == input.end() || it->is_null()) {
            if (spec.required) {
                return invalid("Missing required parameter: " + spec.name);
            }
            if (spec.default_value) {
                normalized[spec.name] = *spec.default_value;
            }
            continue;
        }
        nlohmann::json coerced;
        if (auto err = coerce_value(spec, *it, coerced)) return err;
        normalized[spec.name] = std::move(coerced);
    }

    if (ignored) {
        for (auto& [key, _] : input.items()) {
            if (!descriptor.find_param(key)) ignored->push_back(key);
        }
    }

    out = std::move(normalized);
    return std::nullopt;
}

nlohmann::json input_schema_json(const ToolDescriptor& descriptor) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& spec : descriptor.params) {
        nlohmann::json prop;
        switch (spec.type) {
            case ParamType::String:
            case ParamType::Enum:
                prop["type"] = "string";
                break;
            case ParamType::Integer:
                prop["type"] = "integer";
                break;
            case ParamType::Boolean:
                prop["type"] = "boolean";
                break;
            case ParamType::StringList:
                prop["type"] = "array";
                prop["items"] = {{"type", "string"}};
                break;
        }
        prop["description"] = spec.description;
        if (spec.type == ParamType::Enum) prop["enum"] = spec.enum_values;
        if (spec.minimum) prop["minimum"] = *spec.minimum;
        if (spec.maximum) prop["maximum"] = *spec.maximum;
        if (spec.default_value) prop["default"] = *spec.default_value;

        properties[spec.name] = std::move(prop);
        if (spec.required) required.push_back(spec.name);
    }

    return {
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

} // namespace sshmcp
