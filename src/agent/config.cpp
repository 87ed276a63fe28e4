#include "agent/config.hpp"
#include "core/slot_index.hpp"
#include <cstdlib>
#include <iostream>
#include <limits>

namespace agent {

namespace {

int parse_port(const char* value, int fallback) {
    if (!value) return fallback;
    try {
        const int port = std::stoi(value);
        if (port < 1 || port > 65535) return fallback;
        return port;
    } catch (const std::exception&) {
        std::cerr << "[CONFIG] Ignoring invalid port '" << value << "'\n";
        return fallback;
    }
}

// Values above `max` keep the fallback instead of wrapping
template <typename T>
T parse_unsigned(const char* value, T fallback, unsigned long long max) {
    if (!value) return fallback;
    try {
        const std::string text(value);
        if (text.empty() || text.find('-') != std::string::npos) return fallback;
        const unsigned long long parsed = std::stoull(text);
        if (parsed > max) {
            std::cerr << "[CONFIG] Ignoring out-of-range number '" << value << "'\n";
            return fallback;
        }
        return static_cast<T>(parsed);
    } catch (const std::exception&) {
        std::cerr << "[CONFIG] Ignoring invalid number '" << value << "'\n";
        return fallback;
    }
}

bool parse_flag(const char* value) {
    if (!value) return false;
    const std::string text(value);
    return !text.empty() && text != "0" && text != "false";
}

} // namespace

Config Config::from_env() {
    return from_env([](const char* name) { return std::getenv(name); });
}

Config Config::from_env(const std::function<const char*(const char*)>& lookup) {
    Config config;

    if (const char* host = lookup("BLOCKSCAPE_HOST")) {
        if (*host) config.endpoint.host = host;
    }
    config.endpoint.port = parse_port(lookup("BLOCKSCAPE_PORT"), config.endpoint.port);

    config.verbose = !parse_flag(lookup("CHECKERS_BOT_QUIET"));
    config.max_matches = parse_unsigned<int>(lookup("CHECKERS_BOT_MAX_MATCHES"), config.max_matches,
                                             std::numeric_limits<int>::max());
    config.start_index = parse_unsigned<uint64_t>(lookup("CHECKERS_BOT_START"), config.start_index,
                                                  core::SlotIndex::INDEX_LIMIT - 1);
    config.seed = parse_unsigned<uint32_t>(lookup("CHECKERS_BOT_SEED"), config.seed,
                                           std::numeric_limits<uint32_t>::max());

    return config;
}

} // namespace agent
