#include "core/slot_index.hpp"
#include <stdexcept>

namespace core {

uint64_t SlotIndex::encode(uint32_t x, uint32_t y) {
    if (x >= COORD_LIMIT || y >= COORD_LIMIT) {
        throw std::out_of_range("slot coordinate exceeds 31 bits: (" +
                                std::to_string(x) + ", " + std::to_string(y) + ")");
    }
    return static_cast<uint64_t>(x) * COORD_LIMIT + y;
}

SlotCoord SlotIndex::decode(uint64_t index) {
    if (index >= INDEX_LIMIT) {
        throw std::out_of_range("slot index out of range: " + std::to_string(index));
    }
    SlotCoord coord;
    coord.x = static_cast<uint32_t>(index / COORD_LIMIT);
    coord.y = static_cast<uint32_t>(index % COORD_LIMIT);
    return coord;
}

std::pair<std::string, std::string> SlotIndex::to_params(uint64_t index) {
    SlotCoord coord = decode(index);
    return {std::to_string(coord.x), std::to_string(coord.y)};
}

} // namespace core
