#pragma once

#include "core/types.hpp"

#include <unordered_set>

namespace ij::map {

/// Axis-aligned rectangle of cells a structure occupies.
struct Footprint {
    GridCell origin;
    i32 width = 1;
    i32 height = 1;

    bool contains(const GridCell& c) const {
        return c.x >= origin.x && c.x < origin.x + width &&
               c.y >= origin.y && c.y < origin.y + height;
    }

    bool overlaps(const Footprint& o) const {
        return origin.x < o.origin.x + o.width && o.origin.x < origin.x + width &&
               origin.y < o.origin.y + o.height && o.origin.y < origin.y + height;
    }

    /// Invoke fn(GridCell) for every covered cell, row by row.
    template <typename F>
    void for_each_cell(F&& fn) const {
        for (i32 dy = 0; dy < height; ++dy) {
            for (i32 dx = 0; dx < width; ++dx) {
                fn(GridCell{origin.x + dx, origin.y + dy});
            }
        }
    }
};

/// Set of blocked cells over a fixed-size grid. Bounds are not enforced by
/// the set itself; is_walkable() reports anything outside the grid as
/// blocked.
class ObstacleMap {
public:
    ObstacleMap(u32 width, u32 height);

    u32 width() const { return width_; }
    u32 height() const { return height_; }

    void block(const GridCell& cell);
    void unblock(const GridCell& cell);

    bool is_blocked(const GridCell& cell) const;
    bool is_walkable(const GridCell& cell) const;
    bool in_bounds(const GridCell& cell) const;

    void block_footprint(const Footprint& fp);
    void unblock_footprint(const Footprint& fp);

    size_t blocked_count() const { return blocked_.size(); }

private:
    u32 width_;
    u32 height_;
    std::unordered_set<GridCell, GridCellHash> blocked_;
};

} // namespace ij::map
