#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <ctime>
#include <sys/types.h>

namespace toolbelt {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Expand a leading "~" or "~/" to $HOME. "~user" forms are left untouched.
std::string expand_home(const std::string& path);

// Human readable size, 1024-based: "512 B", "1.5 KB", "3.0 MB"
std::string format_size(uint64_t bytes);

// ls -l style permission string, e.g. "drwxr-xr-x"
std::string format_mode(mode_t mode);

// RFC 3339 timestamp in local time, e.g. "2024-05-01T12:00:00+02:00"
std::string format_time_rfc3339(std::time_t t);

// Standard base64 (with padding)
std::string base64_encode(const std::string& data);

// Minimal line-by-line diff with "--- name" / "+++ name" headers.
// Lines that differ at the same index are emitted as -old / +new.
std::string line_diff(const std::string& original, const std::string& modified,
                      const std::string& filename);

} // namespace toolbelt
