#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <sys/stat.h>
#include <openssl/evp.h>

namespace toolbelt {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
        result.push_back(token);
    }
    return result;
}

std::string expand_home(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

std::string format_size(uint64_t bytes) {
    constexpr uint64_t unit = 1024;
    char buf[32];
    if (bytes < unit) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
        return buf;
    }
    uint64_t div = unit;
    int exp = 0;
    for (uint64_t n = bytes / unit; n >= unit; n /= unit) {
        div *= unit;
        ++exp;
    }
    std::snprintf(buf, sizeof(buf), "%.1f %cB",
                  static_cast<double>(bytes) / static_cast<double>(div), "KMGTPE"[exp]);
    return buf;
}

std::string format_mode(mode_t mode) {
    std::string out(10, '-');
    if (S_ISDIR(mode)) out[0] = 'd';
    else if (S_ISLNK(mode)) out[0] = 'l';
    else if (S_ISCHR(mode)) out[0] = 'c';
    else if (S_ISBLK(mode)) out[0] = 'b';
    else if (S_ISFIFO(mode)) out[0] = 'p';
    else if (S_ISSOCK(mode)) out[0] = 's';

    const char* rwx = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
        if (mode & (1 << (8 - i))) out[i + 1] = rwx[i];
    }
    return out;
}

std::string format_time_rfc3339(std::time_t t) {
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    // %z gives +hhmm; RFC 3339 wants +hh:mm (or Z for UTC)
    char zone[8];
    std::strftime(zone, sizeof(zone), "%z", &tm_buf);
    std::string z(zone);
    if (z == "+0000" || z.size() != 5) return std::string(buf) + "Z";
    return std::string(buf) + z.substr(0, 3) + ":" + z.substr(3);
}

std::string base64_encode(const std::string& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(data.data()),
                            static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

std::string line_diff(const std::string& original, const std::string& modified,
                      const std::string& filename) {
    // split() drops a trailing empty field, so count the final newline ourselves
    auto lines_of = [](const std::string& text) {
        std::vector<std::string> lines = split(text, '\n');
        if (text.empty() || text.back() == '\n') lines.emplace_back();
        return lines;
    };
    std::vector<std::string> orig = lines_of(original);
    std::vector<std::string> mod = lines_of(modified);

    std::string out = "--- " + filename + "\n+++ " + filename + "\n";
    size_t max_len = std::max(orig.size(), mod.size());
    for (size_t i = 0; i < max_len; ++i) {
        const std::string& a = i < orig.size() ? orig[i] : std::string();
        const std::string& b = i < mod.size() ? mod[i] : std::string();
        if (a == b) continue;
        if (!a.empty()) out += "-" + a + "\n";
        if (!b.empty()) out += "+" + b + "\n";
    }
    return out;
}

} // namespace toolbelt
