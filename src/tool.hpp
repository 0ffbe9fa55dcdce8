#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolbelt {

enum class ParamType {
    String,
    Number,
    Boolean,
    StringArray,
    ObjectArray,
};

// JSON schema type name for a parameter type ("string", "array", ...)
const char* param_type_name(ParamType type);

// One property of a tool's input schema.
struct ParamSpec {
    std::string name;
    ParamType type = ParamType::String;
    std::string description;
    bool required = false;
    nlohmann::json default_value;            // null = no default
    std::vector<std::string> enum_values;    // String only
    std::vector<std::string> item_fields;    // ObjectArray: required string fields
    size_t min_items = 0;                    // arrays only
    bool sandboxed = false;                  // checked against the PathSandbox
};

// Schema property helpers
ParamSpec string_param(const std::string& name, const std::string& description = "");
ParamSpec number_param(const std::string& name, const std::string& description = "");
ParamSpec bool_param(const std::string& name, const std::string& description = "");
ParamSpec string_array_param(const std::string& name, const std::string& description = "");
ParamSpec required(ParamSpec p);
ParamSpec sandboxed(ParamSpec p);
ParamSpec with_default(ParamSpec p, nlohmann::json value);

// Static description of a tool. The table of definitions is fixed when an
// agent starts and never changes afterwards.
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ParamSpec> params;

    // Name of a sandboxed parameter that is resolved first and used as the
    // base directory for relative values of the other sandboxed parameters.
    std::string base_param;

    const ParamSpec* find_param(const std::string& param) const;

    // {"name", "description", "inputSchema"}
    nlohmann::json to_json() const;
};

struct ContentItem {
    std::string type = "text";
    std::string text;
    std::string data;        // base64 payload for image/audio/blob items
    std::string mime_type;
};

struct ToolResult {
    std::vector<ContentItem> content;
    bool is_error = false;

    static ToolResult text(const std::string& text);
    static ToolResult error(const std::string& message);

    // First text item, or empty
    std::string first_text() const;

    // {"content":[...]} plus "isError":true when set
    nlohmann::json to_json() const;
};

// Validated, defaulted and sandbox-resolved arguments for one tool call.
// Built only by ToolRegistry; handlers read typed values and never see the
// raw request JSON.
class Arguments {
public:
    Arguments() = default;
    explicit Arguments(nlohmann::json values,
                       std::unordered_map<std::string, nlohmann::json> originals = {});

    bool has(const std::string& name) const;

    // Typed accessors. The registry has already checked types, so a call for a
    // missing argument returns the empty value of the type.
    std::string str(const std::string& name) const;
    std::optional<std::string> opt_str(const std::string& name) const;
    double number(const std::string& name, double fallback = 0) const;
    std::optional<double> opt_number(const std::string& name) const;
    bool flag(const std::string& name, bool fallback = false) const;
    std::vector<std::string> strings(const std::string& name) const;
    std::vector<nlohmann::json> objects(const std::string& name) const;

    // Value as supplied by the caller before sandbox resolution. Falls back
    // to the stored value for arguments that were not sandboxed.
    std::string original(const std::string& name) const;
    std::vector<std::string> original_strings(const std::string& name) const;

    const nlohmann::json& values() const { return values_; }

private:
    nlohmann::json values_ = nlohmann::json::object();
    std::unordered_map<std::string, nlohmann::json> originals_;
};

// Executes one named operation on behalf of the registry. Implementations
// wrap an external program, a syscall family or a network API. Failures of
// that external system are reported as a ToolResult with is_error set; an
// exception escaping execute() is treated the same way by the registry.
class ToolBackend {
public:
    virtual ~ToolBackend() = default;
    virtual ToolResult execute(const std::string& tool_name, const Arguments& args) = 0;
};

} // namespace toolbelt
