#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <chrono>

namespace sshmcp {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Standard base64 alphabet, no '=' padding (OpenSSH fingerprint form)
std::string base64_encode(const unsigned char* data, size_t len);

// Decode standard base64, padding optional. Throws std::invalid_argument
// on characters outside the alphabet.
std::string base64_decode(const std::string& text);

// "0600"-style octal rendering of the permission bits of a mode
std::string format_mode(uint32_t mode);

// POSIX sh quoting: plain words pass through, anything else is wrapped in
// single quotes ("it's" -> 'it'\''s')
std::string shell_quote(const std::string& word);

// argv rendered as one copy-pasteable command line
std::string shell_join(const std::vector<std::string>& argv);

// Milliseconds elapsed since start
int64_t elapsed_ms(std::chrono::steady_clock::time_point start);

} // namespace sshmcp
