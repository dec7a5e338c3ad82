#include "map/obstacle_map.hpp"
#include "map/coordinate_transform.hpp"

namespace ij::map {

ObstacleMap::ObstacleMap(u32 width, u32 height)
    : width_(width == 0 ? 1 : width), height_(height == 0 ? 1 : height) {}

void ObstacleMap::block(const GridCell& cell) {
    blocked_.insert(cell);
}

void ObstacleMap::unblock(const GridCell& cell) {
    blocked_.erase(cell);
}

bool ObstacleMap::is_blocked(const GridCell& cell) const {
    return blocked_.contains(cell);
}

bool ObstacleMap::in_bounds(const GridCell& cell) const {
    return CoordinateTransform::in_bounds(cell, width_, height_);
}

bool ObstacleMap::is_walkable(const GridCell& cell) const {
    if (!in_bounds(cell)) return false;
    return !blocked_.contains(cell);
}

void ObstacleMap::block_footprint(const Footprint& fp) {
    fp.for_each_cell([this](const GridCell& c) { block(c); });
}

void ObstacleMap::unblock_footprint(const Footprint& fp) {
    fp.for_each_cell([this](const GridCell& c) { unblock(c); });
}

} // namespace ij::map
