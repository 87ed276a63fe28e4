#include "ledger/json_rpc_client.hpp"
#include "ledger/errors.hpp"

#include <httplib.h>

#include <iostream>
#include <memory>
#include <utility>

namespace ledger {

namespace {

PlayerId identity_from(const Json::Value& result) {
    if (result.isNull() || (result.isString() && result.asString().empty())) {
        throw RpcError("ledger returned no player identity");
    }
    if (result.isString()) return result.asString();

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, result);
}

Json::Value slot_params(uint32_t x, uint32_t y) {
    Json::Value params(Json::arrayValue);
    params.append(std::to_string(x));
    params.append(std::to_string(y));
    return params;
}

} // namespace

Json::Value make_request(uint64_t id, const std::string& method, const Json::Value& params) {
    Json::Value request(Json::objectValue);
    request["jsonrpc"] = "2.0";
    request["id"] = Json::UInt64(id);
    request["method"] = method;
    request["params"] = params;
    return request;
}

Json::Value read_rpc_result(const std::string& body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value response;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &response, &errors)) {
        throw TransportError("invalid JSON-RPC response: " + errors);
    }
    if (!response.isObject()) {
        throw TransportError("JSON-RPC response is not an object");
    }

    const Json::Value& error = response["error"];
    if (!error.isNull()) {
        std::string message = error.isObject() && error["message"].isString()
                                  ? error["message"].asString()
                                  : "unknown ledger error";
        throw RpcError(message);
    }
    return response["result"];
}

JsonRpcClient::JsonRpcClient(Endpoint endpoint, bool verbose)
    : endpoint_(std::move(endpoint)), verbose_(verbose) {
}

Json::Value JsonRpcClient::call(const std::string& method, const Json::Value& params) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    const std::string body = Json::writeString(writer, make_request(next_id_++, method, params));

    if (verbose_) {
        std::cerr << "[RPC SEND] " << body << "\n";
    }
    const std::string reply = post(body);
    if (verbose_) {
        std::cerr << "[RPC RECV] " << (reply.size() > 200 ? reply.substr(0, 200) + "..." : reply) << "\n";
    }
    return read_rpc_result(reply);
}

std::string JsonRpcClient::post(const std::string& body) {
    httplib::Client http(endpoint_.host, endpoint_.port);
    http.set_connection_timeout(endpoint_.io_timeout);
    http.set_read_timeout(endpoint_.io_timeout);
    http.set_write_timeout(endpoint_.io_timeout);
    http.set_keep_alive(false);

    auto res = http.Post("/", body, "application/json");
    if (!res) {
        throw TransportError("request to " + endpoint_.host + ":" + std::to_string(endpoint_.port) +
                             " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw TransportError("HTTP status " + std::to_string(res->status));
    }
    return res->body;
}

PlayerId JsonRpcClient::register_my_player() {
    return identity_from(call("register_my_player", Json::Value(Json::arrayValue)));
}

PlayerId JsonRpcClient::get_my_player() {
    return identity_from(call("get_my_player", Json::Value(Json::arrayValue)));
}

std::string JsonRpcClient::get_checkers_board(uint32_t x, uint32_t y) {
    Json::Value result = call("get_checkers_board", slot_params(x, y));
    if (!result.isString()) {
        throw RpcError("get_checkers_board returned no board");
    }
    return result.asString();
}

void JsonRpcClient::new_checkers_game(uint32_t x, uint32_t y, const std::string& other_player) {
    Json::Value params = slot_params(x, y);
    params.append(other_player);
    call("new_checkers_game", params);
}

void JsonRpcClient::join_checkers_game(uint32_t x, uint32_t y) {
    call("join_checkers_game", slot_params(x, y));
}

void JsonRpcClient::play_checkers(uint32_t x, uint32_t y, const core::Move& move) {
    Json::Value params = slot_params(x, y);
    for (const auto& part : move.to_params()) {
        params.append(part);
    }
    call("play_checkers", params);
}

} // namespace ledger
