#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace core {

// The ledger names a match by a pair of 31-bit coordinates; the agent walks
// them as a single queue position: index = x * 2^31 + y.
struct SlotCoord {
    uint32_t x = 0;
    uint32_t y = 0;

    bool operator==(const SlotCoord& other) const noexcept {
        return x == other.x && y == other.y;
    }
};

class SlotIndex {
public:
    static constexpr uint64_t COORD_LIMIT = uint64_t{1} << 31;
    static constexpr uint64_t INDEX_LIMIT = COORD_LIMIT * COORD_LIMIT;

    // Throws std::out_of_range when x or y does not fit in 31 bits
    static uint64_t encode(uint32_t x, uint32_t y);
    static uint64_t encode(const SlotCoord& coord) { return encode(coord.x, coord.y); }

    // Throws std::out_of_range for index >= 2^62
    static SlotCoord decode(uint64_t index);

    // Decimal strings as the RPC methods expect them
    static std::pair<std::string, std::string> to_params(uint64_t index);
};

} // namespace core
