#pragma once
#include "rpc.hpp"
#include "sandbox.hpp"
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace toolbelt {

// Outcome of one tools/call. When `error` is set the call was rejected before
// the backend ran and the server answers with a JSON-RPC error; otherwise
// `result` is the tool result (possibly with is_error set by the backend).
struct CallOutcome {
    std::optional<RpcError> error;
    ToolResult result;
};

// Closed table of tools for one agent. Validates every call against the
// tool's schema and the sandbox before the backend sees it.
class ToolRegistry {
public:
    ToolRegistry(std::vector<ToolDefinition> tools, ToolBackend& backend,
                 const PathSandbox& sandbox, spdlog::logger& log);

    // {"tools":[...]} built once at construction
    const nlohmann::json& list_json() const { return list_json_; }

    const ToolDefinition* find(const std::string& name) const;
    const std::vector<ToolDefinition>& tools() const { return tools_; }

    // Handle the params object of a tools/call request.
    CallOutcome call(const nlohmann::json& params);

    // Invoke a tool by name with a raw arguments object.
    CallOutcome call(const std::string& name, const nlohmann::json& arguments);

    // Schema-driven decode: check presence and types, fill defaults and
    // resolve sandboxed parameters. Returns the error that rejects the call,
    // or nullopt with `out` populated.
    std::optional<RpcError> decode(const ToolDefinition& tool,
                                   const nlohmann::json& arguments,
                                   Arguments& out) const;

private:
    std::vector<ToolDefinition> tools_;
    ToolBackend& backend_;
    const PathSandbox& sandbox_;
    spdlog::logger& log_;
    nlohmann::json list_json_;
};

} // namespace toolbelt
