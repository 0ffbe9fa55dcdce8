#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolbelt {

struct Config {
    std::string log_dir = "~/.toolbelt/logs";
    std::string log_level = "info";
    std::vector<std::string> allowed_paths;   // raw, not yet canonical

    // Defaults, then ~/.toolbelt/config.json (or $TOOLBELT_CONFIG) when it
    // exists, then environment variables. The file is never written.
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply a parsed config object on top of this one
    void apply_json(const nlohmann::json& j);

    // TOOLBELT_ALLOWED_PATHS, TOOLBELT_LOG_DIR, TOOLBELT_LOG_LEVEL
    void apply_env();

    // log_dir with "~" expanded
    std::string resolved_log_dir() const;
};

// Split a comma-separated list of paths, trimming blanks
std::vector<std::string> parse_path_list(const std::string& list);

// Normalize a log level name; unknown names fall back to "info"
std::string normalize_log_level(const std::string& level);

} // namespace toolbelt
