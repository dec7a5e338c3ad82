#pragma once

#include "core/types.hpp"

#include <array>
#include <cstdlib>

namespace ij::map {

/// Parameters of the isometric projection. Defaults match the 1024x768
/// canvas: the x offset is half the canvas width plus room for the
/// dashboard on the left, the y offset keeps row 0 clear of the top edge.
struct IsoProjection {
    f32 tile_width = 64.0f;
    f32 tile_height = 32.0f;
    f32 x_offset = 632.0f;
    f32 y_offset = 100.0f;
};

/// Stateless mapping between grid cells and projected screen coordinates.
class CoordinateTransform {
public:
    CoordinateTransform() = default;
    explicit CoordinateTransform(const IsoProjection& projection);

    /// Screen position of a (possibly fractional) grid coordinate.
    ScreenPoint to_screen(f32 gx, f32 gy) const;
    ScreenPoint to_screen(const GridCell& cell) const {
        return to_screen(static_cast<f32>(cell.x), static_cast<f32>(cell.y));
    }

    /// Inverse of to_screen, floored to the cell whose diamond contains the
    /// point. Only integer grid coordinates survive a round trip exactly.
    GridCell to_grid(f32 sx, f32 sy) const;
    GridCell to_grid(const ScreenPoint& p) const { return to_grid(p.x, p.y); }

    /// Unfloored inverse: the fractional grid coordinate under a screen point.
    void to_grid_fractional(const ScreenPoint& p, f32& gx, f32& gy) const;

    /// Paint-order key: larger values are drawn later (closer to viewer).
    static f32 depth_key(f32 gx, f32 gy, f32 z_offset = 0.0f) {
        return (gx + gy) * 10.0f + z_offset;
    }

    static i32 manhattan(const GridCell& a, const GridCell& b) {
        return std::abs(a.x - b.x) + std::abs(a.y - b.y);
    }

    /// 4-connected neighbors in west, east, north, south order.
    static std::array<GridCell, 4> neighbors(const GridCell& c) {
        return {{{c.x - 1, c.y}, {c.x + 1, c.y}, {c.x, c.y - 1}, {c.x, c.y + 1}}};
    }

    static bool in_bounds(const GridCell& c, u32 width, u32 height) {
        return c.x >= 0 && c.y >= 0 && static_cast<u32>(c.x) < width &&
               static_cast<u32>(c.y) < height;
    }

private:
    void unproject(f32 sx, f32 sy, f64& gx, f64& gy) const;

    IsoProjection projection_;
};

} // namespace ij::map
