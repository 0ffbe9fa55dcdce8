#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace toolbelt {

// JSON-RPC 2.0 error codes used on the wire
namespace rpc_codes {
    constexpr int ParseError     = -32700;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams  = -32602;
    constexpr int InternalError  = -32603;
} // namespace rpc_codes

struct RpcError {
    int code = rpc_codes::InternalError;
    std::string message;
    nlohmann::json data;     // omitted from the envelope when null
};

// {"jsonrpc":"2.0","id":id,"result":result}
nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result);

// {"jsonrpc":"2.0","id":id,"error":{"code","message","data"}}
nlohmann::json make_error(const nlohmann::json& id, const RpcError& error);

// Compact one-line encoding. Invalid UTF-8 in strings is replaced rather than
// rejected; nlohmann::json::exception still propagates for anything else.
std::string encode_line(const nlohmann::json& message);

} // namespace toolbelt
