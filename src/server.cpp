#include "server.hpp"
#include "util.hpp"

#include <iostream>
#include <spdlog/spdlog.h>

namespace toolbelt {

Server::Server(ServerInfo info, ToolRegistry& registry, spdlog::logger& log)
    : info_(std::move(info)), registry_(registry), log_(log) {}

nlohmann::json Server::initialize_result() const {
    nlohmann::json capabilities = {{"tools", nlohmann::json::object()}};
    if (info_.resources) {
        capabilities["resources"] = nlohmann::json::object();
    }
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", capabilities},
        {"serverInfo", {{"name", info_.name}, {"version", info_.version}}}
    };
}

std::string Server::encode(const nlohmann::json& id, const nlohmann::json& message) {
    try {
        std::string line = encode_line(message);
        log_.info("Sent response for request ID: {}", id.dump());
        return line;
    } catch (const nlohmann::json::exception& e) {
        log_.error("Error encoding response: {}", e.what());
        return encode_line(make_error(id, RpcError{rpc_codes::InternalError,
                                                   "Internal error", e.what()}));
    }
}

std::optional<std::string> Server::handle_line(const std::string& line) {
    if (trim(line).empty()) return std::nullopt;

    log_.info("Received request: {}", line);

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        log_.warn("Parse error: {}", e.what());
        return encode(nullptr, make_error(nullptr, RpcError{rpc_codes::ParseError,
                                                            "Parse error", e.what()}));
    }
    if (!request.is_object()) {
        log_.warn("Parse error: request is not a JSON object");
        return encode(nullptr, make_error(nullptr, RpcError{rpc_codes::ParseError, "Parse error",
                                                            "request must be a JSON object"}));
    }

    // The id is opaque: echoed back exactly as received
    nlohmann::json id = request.contains("id") ? request["id"] : nlohmann::json();
    std::string method;
    if (request.contains("method") && request["method"].is_string()) {
        method = request["method"].get<std::string>();
    }

    log_.info("Handling method: {}", method);

    if (method.rfind("notifications/", 0) == 0) {
        log_.info("Received notification: {}", method);
        return std::nullopt;
    }

    if (method == "initialize") {
        return encode(id, make_result(id, initialize_result()));
    }
    if (method == "tools/list") {
        return encode(id, make_result(id, registry_.list_json()));
    }
    if (method == "tools/call") {
        nlohmann::json params = request.contains("params") ? request["params"]
                                                           : nlohmann::json();
        CallOutcome outcome = registry_.call(params);
        if (outcome.error) {
            log_.warn("Sending error response: code={}, message={}",
                      outcome.error->code, outcome.error->message);
            return encode(id, make_error(id, *outcome.error));
        }
        return encode(id, make_result(id, outcome.result.to_json()));
    }

    log_.warn("Unknown method: {}", method);
    return encode(id, make_error(id, RpcError{rpc_codes::MethodNotFound, "Method not found",
                                              "Unknown method: " + method}));
}

int Server::run(std::istream& in, std::ostream& out) {
    log_.info("Listening for requests on stdin...");

    std::string line;
    while (std::getline(in, line)) {
        auto response = handle_line(line);
        if (!response) continue;
        out << *response << '\n';
        out.flush();
        if (!out) {
            log_.error("Error writing response to stdout");
            return 1;
        }
    }

    if (in.bad()) {
        log_.error("Error reading stdin");
        return 1;
    }
    log_.info("Server shutting down");
    return 0;
}

int serve(const ServerInfo& info, std::vector<ToolDefinition> tools,
          ToolBackend& backend, const PathSandbox& sandbox, spdlog::logger& log) {
    ToolRegistry registry(std::move(tools), backend, sandbox, log);
    Server server(info, registry, log);
    log.info("Server initialized with {} tools", registry.tools().size());
    return server.run(std::cin, std::cout);
}

} // namespace toolbelt
