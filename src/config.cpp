#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace toolbelt {

nlohmann::json Config::defaults_json() {
    return {
        {"log_dir", "~/.toolbelt/logs"},
        {"log_level", "info"},
        {"allowed_paths", nlohmann::json::array()}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.toolbelt/config.json");
    if (const char* v = std::getenv("TOOLBELT_CONFIG")) {
        if (*v) config_path = expand_home(v);
    }

    nlohmann::json j = defaults_json();
    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path << ": "
                      << e.what() << "\n";
            j = defaults_json();
        }
    }

    cfg.apply_json(j);
    cfg.apply_env();
    return cfg;
}

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) return;
    if (j.contains("log_dir") && j["log_dir"].is_string())
        log_dir = j["log_dir"].get<std::string>();
    if (j.contains("log_level") && j["log_level"].is_string())
        log_level = normalize_log_level(j["log_level"].get<std::string>());
    if (j.contains("allowed_paths") && j["allowed_paths"].is_array()) {
        for (const auto& p : j["allowed_paths"]) {
            if (p.is_string()) allowed_paths.push_back(p.get<std::string>());
        }
    }
}

void Config::apply_env() {
    // Environment variables always override the config file
    if (const char* v = std::getenv("TOOLBELT_ALLOWED_PATHS")) {
        auto paths = parse_path_list(v);
        if (!paths.empty()) allowed_paths = std::move(paths);
    }
    if (const char* v = std::getenv("TOOLBELT_LOG_DIR")) {
        if (*v) log_dir = v;
    }
    if (const char* v = std::getenv("TOOLBELT_LOG_LEVEL")) {
        if (*v) log_level = normalize_log_level(v);
    }
}

std::string Config::resolved_log_dir() const {
    return expand_home(log_dir);
}

std::vector<std::string> parse_path_list(const std::string& list) {
    std::vector<std::string> out;
    for (const auto& part : split(list, ',')) {
        std::string p = trim(part);
        if (!p.empty()) out.push_back(p);
    }
    return out;
}

std::string normalize_log_level(const std::string& level) {
    std::string l = trim(level);
    if (l == "warning") return "warn";
    if (l == "silent") return "off";
    if (l == "trace" || l == "debug" || l == "info" || l == "warn" ||
        l == "error" || l == "critical" || l == "off") {
        return l;
    }
    return "info";
}

} // namespace toolbelt
