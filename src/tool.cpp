#include "tool.hpp"

namespace toolbelt {

const char* param_type_name(ParamType type) {
    switch (type) {
        case ParamType::String:      return "string";
        case ParamType::Number:      return "number";
        case ParamType::Boolean:     return "boolean";
        case ParamType::StringArray: return "array";
        case ParamType::ObjectArray: return "array";
    }
    return "string";
}

static ParamSpec make_param(const std::string& name, ParamType type,
                            const std::string& description) {
    ParamSpec p;
    p.name = name;
    p.type = type;
    p.description = description;
    return p;
}

ParamSpec string_param(const std::string& name, const std::string& description) {
    return make_param(name, ParamType::String, description);
}

ParamSpec number_param(const std::string& name, const std::string& description) {
    return make_param(name, ParamType::Number, description);
}

ParamSpec bool_param(const std::string& name, const std::string& description) {
    return make_param(name, ParamType::Boolean, description);
}

ParamSpec string_array_param(const std::string& name, const std::string& description) {
    return make_param(name, ParamType::StringArray, description);
}

ParamSpec required(ParamSpec p) {
    p.required = true;
    return p;
}

ParamSpec sandboxed(ParamSpec p) {
    p.sandboxed = true;
    return p;
}

ParamSpec with_default(ParamSpec p, nlohmann::json value) {
    p.default_value = std::move(value);
    return p;
}

// ── ToolDefinition ──────────────────────────────────────────────

const ParamSpec* ToolDefinition::find_param(const std::string& param) const {
    for (const auto& p : params) {
        if (p.name == param) return &p;
    }
    return nullptr;
}

nlohmann::json ToolDefinition::to_json() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required_names = nlohmann::json::array();

    for (const auto& p : params) {
        nlohmann::json prop = {{"type", param_type_name(p.type)}};
        if (!p.description.empty()) prop["description"] = p.description;
        if (!p.enum_values.empty()) prop["enum"] = p.enum_values;
        if (!p.default_value.is_null()) prop["default"] = p.default_value;

        if (p.type == ParamType::StringArray) {
            prop["items"] = {{"type", "string"}};
        } else if (p.type == ParamType::ObjectArray) {
            nlohmann::json items = {{"type", "object"}};
            if (!p.item_fields.empty()) {
                nlohmann::json item_props = nlohmann::json::object();
                for (const auto& field : p.item_fields) {
                    item_props[field] = {{"type", "string"}};
                }
                items["properties"] = item_props;
                items["required"] = p.item_fields;
            }
            prop["items"] = items;
        }
        if (p.min_items > 0) prop["minItems"] = p.min_items;

        properties[p.name] = prop;
        if (p.required) required_names.push_back(p.name);
    }

    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required_names.empty()) schema["required"] = required_names;

    return {{"name", name}, {"description", description}, {"inputSchema", schema}};
}

// ── ToolResult ──────────────────────────────────────────────────

ToolResult ToolResult::text(const std::string& text) {
    ToolResult r;
    ContentItem item;
    item.text = text;
    r.content.push_back(std::move(item));
    return r;
}

ToolResult ToolResult::error(const std::string& message) {
    ToolResult r = text(message);
    r.is_error = true;
    return r;
}

std::string ToolResult::first_text() const {
    for (const auto& item : content) {
        if (item.type == "text") return item.text;
    }
    return {};
}

nlohmann::json ToolResult::to_json() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& c : content) {
        nlohmann::json item = {{"type", c.type}};
        if (c.type == "text") {
            item["text"] = c.text;
        } else {
            item["data"] = c.data;
        }
        if (!c.mime_type.empty()) item["mimeType"] = c.mime_type;
        items.push_back(std::move(item));
    }
    nlohmann::json out = {{"content", items}};
    if (is_error) out["isError"] = true;
    return out;
}

// ── Arguments ───────────────────────────────────────────────────

Arguments::Arguments(nlohmann::json values,
                     std::unordered_map<std::string, nlohmann::json> originals)
    : values_(std::move(values)), originals_(std::move(originals)) {
    if (!values_.is_object()) values_ = nlohmann::json::object();
}

bool Arguments::has(const std::string& name) const {
    return values_.contains(name) && !values_[name].is_null();
}

std::string Arguments::str(const std::string& name) const {
    return opt_str(name).value_or("");
}

std::optional<std::string> Arguments::opt_str(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

double Arguments::number(const std::string& name, double fallback) const {
    return opt_number(name).value_or(fallback);
}

std::optional<double> Arguments::opt_number(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

bool Arguments::flag(const std::string& name, bool fallback) const {
    auto it = values_.find(name);
    if (it == values_.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

std::vector<std::string> Arguments::strings(const std::string& name) const {
    std::vector<std::string> out;
    auto it = values_.find(name);
    if (it == values_.end() || !it->is_array()) return out;
    for (const auto& v : *it) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

std::vector<nlohmann::json> Arguments::objects(const std::string& name) const {
    std::vector<nlohmann::json> out;
    auto it = values_.find(name);
    if (it == values_.end() || !it->is_array()) return out;
    for (const auto& v : *it) {
        if (v.is_object()) out.push_back(v);
    }
    return out;
}

std::string Arguments::original(const std::string& name) const {
    auto it = originals_.find(name);
    if (it != originals_.end() && it->second.is_string()) {
        return it->second.get<std::string>();
    }
    return str(name);
}

std::vector<std::string> Arguments::original_strings(const std::string& name) const {
    auto it = originals_.find(name);
    if (it == originals_.end() || !it->second.is_array()) return strings(name);
    std::vector<std::string> out;
    for (const auto& v : it->second) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

} // namespace toolbelt
