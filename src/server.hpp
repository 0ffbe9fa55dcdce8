#pragma once
#include "registry.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace toolbelt {

constexpr const char* kProtocolVersion = "2024-11-05";

struct ServerInfo {
    std::string name;
    std::string version = "1.0.0";
    bool resources = false;     // advertise an empty "resources" capability
};

// Line-delimited JSON-RPC loop. One request per line, handled to completion
// before the next line is read; exactly one response line per request that
// is not a notification.
class Server {
public:
    Server(ServerInfo info, ToolRegistry& registry, spdlog::logger& log);

    // Handle one input line. Returns the response line, or nullopt when
    // nothing must be written (blank line, notification).
    std::optional<std::string> handle_line(const std::string& line);

    // Read until end of input. Returns 0 on EOF, 1 on a read error.
    int run(std::istream& in, std::ostream& out);

private:
    nlohmann::json initialize_result() const;
    std::string encode(const nlohmann::json& id, const nlohmann::json& message);

    ServerInfo info_;
    ToolRegistry& registry_;
    spdlog::logger& log_;
};

// Build the registry and server for an agent and run it on stdin/stdout.
int serve(const ServerInfo& info, std::vector<ToolDefinition> tools,
          ToolBackend& backend, const PathSandbox& sandbox, spdlog::logger& log);

} // namespace toolbelt
