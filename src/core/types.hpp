#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>

namespace ij {

namespace fs = std::filesystem;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
using f32 = float;
using f64 = double;

/// One discrete tile of the world, addressed by integer grid coordinates.
struct GridCell {
    i32 x = 0;
    i32 y = 0;

    bool operator==(const GridCell&) const = default;
};

/// Projected position in screen pixels.
struct ScreenPoint {
    f32 x = 0;
    f32 y = 0;
};

struct GridCellHash {
    size_t operator()(const GridCell& c) const {
        // Grids are small; pack both axes into one 64-bit key.
        u64 key = (static_cast<u64>(static_cast<u32>(c.x)) << 32) |
                  static_cast<u32>(c.y);
        return std::hash<u64>{}(key);
    }
};

} // namespace ij
