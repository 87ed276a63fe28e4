#pragma once

#include "core/move_generator.hpp"
#include "ledger/json_rpc_client.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace agent {

struct Config {
    using Millis = std::chrono::milliseconds;

    ledger::JsonRpcClient::Endpoint endpoint;
    core::RuleSet rules = core::RuleSet::ledger();

    // Registration
    int register_attempts = 10;
    Millis register_retry_delay{1000};      // doubled after every failed attempt
    Millis registration_settle{30000};      // lets the ledger include the registration

    // Board queries that fail in transit
    int rpc_retries = 5;
    Millis rpc_retry_delay{1000};

    // Claiming
    Millis poll_interval{2000};
    Millis join_timeout{0};                 // 0 waits for a joiner indefinitely
    int create_grace_polls = 15;            // polls a create may stay invisible before it is re-sent

    // Playing
    Millis move_poll_interval{1000};
    Millis move_timeout{5 * 60 * 1000};

    // Session
    uint64_t start_index = 0;
    int max_matches = 0;                    // 0 plays forever
    uint32_t seed = 0;                      // 0 seeds from std::random_device
    bool verbose = true;

    // Reads BLOCKSCAPE_HOST, BLOCKSCAPE_PORT, CHECKERS_BOT_QUIET,
    // CHECKERS_BOT_MAX_MATCHES, CHECKERS_BOT_START and CHECKERS_BOT_SEED.
    // Unset or unparsable values keep their defaults.
    static Config from_env();
    static Config from_env(const std::function<const char*(const char*)>& lookup);
};

} // namespace agent
