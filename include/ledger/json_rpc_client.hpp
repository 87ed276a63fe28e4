#pragma once

#include "ledger_client.hpp"
#include <json/json.h>
#include <chrono>
#include <cstdint>
#include <string>

namespace ledger {

// JSON-RPC 2.0 over HTTP to a ledger node (cpp-httplib). One connection per request.
class JsonRpcClient : public LedgerClient {
public:
    struct Endpoint {
        std::string host = "localhost";
        int port = 8356;
        std::chrono::milliseconds io_timeout{30000};
    };

    explicit JsonRpcClient(Endpoint endpoint, bool verbose = false);
    ~JsonRpcClient() override = default;

    PlayerId register_my_player() override;
    PlayerId get_my_player() override;
    std::string get_checkers_board(uint32_t x, uint32_t y) override;
    void new_checkers_game(uint32_t x, uint32_t y, const std::string& other_player) override;
    void join_checkers_game(uint32_t x, uint32_t y) override;
    void play_checkers(uint32_t x, uint32_t y, const core::Move& move) override;

    // Sends one request and returns its "result" member.
    // Throws RpcError if the response carries "error", TransportError otherwise.
    Json::Value call(const std::string& method, const Json::Value& params);

    const Endpoint& endpoint() const noexcept { return endpoint_; }

private:
    Endpoint endpoint_;
    bool verbose_;
    uint64_t next_id_ = 1;

    // POSTs `body` to "/" and returns the response body.
    // Throws TransportError when the request fails or the status is not 200.
    std::string post(const std::string& body);
};

// Builds the request object for `method` (exposed for tests)
Json::Value make_request(uint64_t id, const std::string& method, const Json::Value& params);

// Interprets a decoded JSON-RPC response body
Json::Value read_rpc_result(const std::string& body);

} // namespace ledger
