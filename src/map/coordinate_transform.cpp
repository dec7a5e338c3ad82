#include "map/coordinate_transform.hpp"

#include <cmath>

namespace ij::map {

CoordinateTransform::CoordinateTransform(const IsoProjection& projection)
    : projection_(projection) {}

ScreenPoint CoordinateTransform::to_screen(f32 gx, f32 gy) const {
    const f32 half_w = projection_.tile_width * 0.5f;
    const f32 half_h = projection_.tile_height * 0.5f;
    return {(gx - gy) * half_w + projection_.x_offset,
            (gx + gy) * half_h + projection_.y_offset};
}

// Solved in double precision so integer cells land exactly before floor.
void CoordinateTransform::unproject(f32 sx, f32 sy, f64& gx, f64& gy) const {
    const f64 half_w = static_cast<f64>(projection_.tile_width) * 0.5;
    const f64 half_h = static_cast<f64>(projection_.tile_height) * 0.5;
    const f64 ax = (static_cast<f64>(sx) - projection_.x_offset) / half_w;
    const f64 ay = (static_cast<f64>(sy) - projection_.y_offset) / half_h;

    gx = (ax + ay) * 0.5;
    gy = (ay - ax) * 0.5;
}

GridCell CoordinateTransform::to_grid(f32 sx, f32 sy) const {
    f64 gx = 0.0, gy = 0.0;
    unproject(sx, sy, gx, gy);
    return {static_cast<i32>(std::floor(gx)), static_cast<i32>(std::floor(gy))};
}

void CoordinateTransform::to_grid_fractional(const ScreenPoint& p, f32& gx,
                                             f32& gy) const {
    f64 x = 0.0, y = 0.0;
    unproject(p.x, p.y, x, y);
    gx = static_cast<f32>(x);
    gy = static_cast<f32>(y);
}

} // namespace ij::map
