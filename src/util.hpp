#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace crancache {

// Monotonic milliseconds (steady clock, arbitrary epoch)
uint64_t steady_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Standard base64 with padding
std::string base64_encode(const std::string& data);

// Percent-encode everything outside RFC 3986 unreserved characters
std::string url_encode(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename; creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace crancache
