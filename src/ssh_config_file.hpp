#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace sshmcp {

// One "Keyword value" line of ssh_config(5) / sshd_config(5)
struct ConfigDirective {
    std::string keyword;  // lowercased
    std::string value;    // trimmed, surrounding quotes removed
    size_t line = 0;      // 1-based
};

// Tokenize config text. Comments and blank lines are skipped; both
// "Key value" and "Key=value" forms are accepted. Host/Match blocks are
// returned as ordinary directives.
std::vector<ConfigDirective> parse_ssh_config(const std::string& contents);

} // namespace sshmcp
