#include "agent/clock.hpp"
#include "agent/config.hpp"
#include "agent/session.hpp"
#include "ledger/json_rpc_client.hpp"
#include <csignal>
#include <exception>
#include <iostream>


int main() {
    // A ledger node closing the connection early must not kill the bot
    std::signal(SIGPIPE, SIG_IGN);

    agent::Config config = agent::Config::from_env();

    std::cout << "Checkers bot talking to " << config.endpoint.host << ":"
              << config.endpoint.port << std::endl;
    if (config.max_matches > 0) {
        std::cout << "Playing " << config.max_matches << " matches" << std::endl;
    }

    ledger::JsonRpcClient client(config.endpoint, false);
    agent::SystemClock clock;
    agent::Session session(client, clock, config);

    try {
        session.run();
    } catch (const agent::RegistrationError& ex) {
        std::cerr << "Fatal: registration failed: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal: " << ex.what() << std::endl;
        return 1;
    }

    std::cout << "Done." << std::endl;
    return 0;
}
