#pragma once

#include <stdexcept>
#include <string>

namespace ledger {

// Socket, HTTP or JSON framing failure; worth retrying
struct TransportError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The ledger answered with a JSON-RPC error object
struct RpcError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// get_checkers_board returned text that is not a board report
struct ParseError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace ledger
