#include "registry.hpp"

#include <spdlog/spdlog.h>
#include <unordered_map>

namespace toolbelt {

static RpcError invalid_arguments(const std::string& detail) {
    return RpcError{rpc_codes::InvalidParams, "Invalid arguments", detail};
}

static std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

// Check one present, non-null value against its declared type.
static std::optional<RpcError> check_value(const ParamSpec& p, const nlohmann::json& value) {
    switch (p.type) {
        case ParamType::String:
            if (!value.is_string()) {
                return invalid_arguments(p.name + " parameter must be a string");
            }
            if (!p.enum_values.empty()) {
                auto s = value.get<std::string>();
                bool found = false;
                for (const auto& e : p.enum_values) {
                    if (e == s) { found = true; break; }
                }
                if (!found) {
                    return invalid_arguments(p.name + " must be one of: " +
                                             join(p.enum_values, ", "));
                }
            }
            break;
        case ParamType::Number:
            if (!value.is_number()) {
                return invalid_arguments(p.name + " parameter must be a number");
            }
            break;
        case ParamType::Boolean:
            if (!value.is_boolean()) {
                return invalid_arguments(p.name + " parameter must be a boolean");
            }
            break;
        case ParamType::StringArray:
            if (!value.is_array()) {
                return invalid_arguments(p.name + " parameter must be an array of strings");
            }
            for (const auto& item : value) {
                if (!item.is_string()) {
                    return invalid_arguments(p.name + " parameter must be an array of strings");
                }
            }
            break;
        case ParamType::ObjectArray:
            if (!value.is_array()) {
                return invalid_arguments(p.name + " parameter must be an array of objects");
            }
            for (size_t i = 0; i < value.size(); ++i) {
                const auto& item = value[i];
                if (!item.is_object()) {
                    return invalid_arguments(p.name + " parameter must be an array of objects");
                }
                for (const auto& field : p.item_fields) {
                    if (!item.contains(field) || !item[field].is_string()) {
                        return invalid_arguments(p.name + "[" + std::to_string(i) + "]." +
                                                 field + " must be a string");
                    }
                }
            }
            break;
    }

    if (p.min_items > 0 && value.is_array() && value.size() < p.min_items) {
        return invalid_arguments(p.name + " must contain at least " +
                                 std::to_string(p.min_items) + " item(s)");
    }
    return std::nullopt;
}

ToolRegistry::ToolRegistry(std::vector<ToolDefinition> tools, ToolBackend& backend,
                           const PathSandbox& sandbox, spdlog::logger& log)
    : tools_(std::move(tools)), backend_(backend), sandbox_(sandbox), log_(log) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& t : tools_) {
        list.push_back(t.to_json());
    }
    list_json_ = {{"tools", list}};
}

const ToolDefinition* ToolRegistry::find(const std::string& name) const {
    for (const auto& t : tools_) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

std::optional<RpcError> ToolRegistry::decode(const ToolDefinition& tool,
                                             const nlohmann::json& arguments,
                                             Arguments& out) const {
    if (!arguments.is_null() && !arguments.is_object()) {
        return RpcError{rpc_codes::InvalidParams, "Invalid params",
                        "arguments must be an object"};
    }

    nlohmann::json values = nlohmann::json::object();
    for (const auto& p : tool.params) {
        bool present = arguments.is_object() && arguments.contains(p.name) &&
                       !arguments[p.name].is_null();
        if (!present) {
            if (p.required) {
                return invalid_arguments(p.name + " parameter is required");
            }
            if (!p.default_value.is_null()) {
                values[p.name] = p.default_value;
            }
            continue;
        }
        const auto& value = arguments[p.name];
        if (auto err = check_value(p, value)) return err;
        values[p.name] = value;
    }

    // Resolve the base parameter first; the rest are taken relative to it.
    std::unordered_map<std::string, nlohmann::json> originals;
    std::string base_dir;

    auto resolve_param = [&](const ParamSpec& p, const std::string& base)
        -> std::optional<RpcError> {
        if (!values.contains(p.name)) return std::nullopt;
        nlohmann::json& value = values[p.name];
        originals[p.name] = value;
        try {
            if (value.is_string()) {
                value = sandbox_.resolve(value.get<std::string>(), base);
            } else if (value.is_array()) {
                for (auto& item : value) {
                    item = sandbox_.resolve(item.get<std::string>(), base);
                }
            }
        } catch (const AccessDenied& e) {
            log_.warn("Access denied for {} in {}: {}", p.name, tool.name, e.candidate());
            return RpcError{rpc_codes::InvalidParams, "Access denied",
                            p.name + ": " + e.what()};
        }
        return std::nullopt;
    };

    if (!tool.base_param.empty()) {
        if (const ParamSpec* base = tool.find_param(tool.base_param)) {
            if (auto err = resolve_param(*base, "")) return err;
            if (values.contains(base->name) && values[base->name].is_string()) {
                base_dir = values[base->name].get<std::string>();
            }
        }
    }

    for (const auto& p : tool.params) {
        if (!p.sandboxed || p.name == tool.base_param) continue;
        if (auto err = resolve_param(p, base_dir)) return err;
    }

    out = Arguments(std::move(values), std::move(originals));
    return std::nullopt;
}

CallOutcome ToolRegistry::call(const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        log_.warn("Invalid tools/call params");
        return CallOutcome{RpcError{rpc_codes::InvalidParams, "Invalid params",
                                    "params must be an object with a string name"},
                           {}};
    }
    nlohmann::json arguments = params.contains("arguments") ? params["arguments"]
                                                            : nlohmann::json();
    return call(params["name"].get<std::string>(), arguments);
}

CallOutcome ToolRegistry::call(const std::string& name, const nlohmann::json& arguments) {
    log_.info("Calling tool: {}", name);

    const ToolDefinition* tool = find(name);
    if (!tool) {
        log_.warn("Unknown tool: {}", name);
        return CallOutcome{RpcError{rpc_codes::InvalidParams, "Unknown tool",
                                    "Tool not found: " + name},
                           {}};
    }

    Arguments args;
    if (auto err = decode(*tool, arguments, args)) {
        log_.warn("Rejected {} call: {}", name,
                  err->data.is_string() ? err->data.get<std::string>() : err->message);
        return CallOutcome{std::move(err), {}};
    }

    ToolResult result;
    try {
        result = backend_.execute(name, args);
    } catch (const std::exception& e) {
        result = ToolResult::error(std::string("Tool execution failed: ") + e.what());
    }

    if (result.is_error) {
        log_.warn("Tool {} failed: {}", name, result.first_text());
    } else {
        log_.info("Tool {} succeeded", name);
    }
    return CallOutcome{std::nullopt, std::move(result)};
}

} // namespace toolbelt
