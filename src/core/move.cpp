#include "core/move.hpp"

namespace core {

const char* direction_token(Direction dir) noexcept {
    switch (dir) {
        case Direction::NW: return "NW";
        case Direction::NE: return "NE";
        case Direction::SE: return "SE";
        case Direction::SW: return "SW";
    }
    return "NE";
}

Square Move::destination() const noexcept {
    int distance = is_jump() ? 2 : 1;
    Square current = origin;
    for (Direction dir : path) {
        current = current.step(dir, distance);
    }
    return current;
}

std::vector<std::string> Move::to_params() const {
    std::vector<std::string> params;
    params.reserve(path.size() + 2);
    params.push_back(origin.to_string());
    params.push_back(is_jump() ? "jump" : "move");
    for (Direction dir : path) {
        params.push_back(direction_token(dir));
    }
    return params;
}

std::string Move::to_string() const {
    std::string out;
    for (const auto& param : to_params()) {
        if (!out.empty()) out += ' ';
        out += param;
    }
    return out;
}

} // namespace core
