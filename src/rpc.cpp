#include "rpc.hpp"

namespace toolbelt {

nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

nlohmann::json make_error(const nlohmann::json& id, const RpcError& error) {
    nlohmann::json err = {{"code", error.code}, {"message", error.message}};
    if (!error.data.is_null()) err["data"] = error.data;
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", err}};
}

std::string encode_line(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace toolbelt
