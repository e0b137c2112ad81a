#include "ssh_config_file.hpp"
#include "util.hpp"

#include <cctype>

namespace sshmcp {

std::vector<ConfigDirective> parse_ssh_config(const std::string& contents) {
    std::vector<ConfigDirective> directives;
    size_t line_no = 0;

    for (const auto& raw : split(contents, '\n')) {
        line_no++;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        size_t i = 0;
        while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i])) &&
               line[i] != '=') {
            i++;
        }
        ConfigDirective d;
        d.keyword = to_lower(line.substr(0, i));
        d.line = line_no;

        // Separator: whitespace with at most one '='
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) i++;
        if (i < line.size() && line[i] == '=') i++;
        std::string value = trim(line.substr(i));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        d.value = value;
        directives.push_back(std::move(d));
    }
    return directives;
}

} // namespace sshmcp
