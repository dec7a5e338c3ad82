#pragma once

#include "core/types.hpp"

#include <vector>

namespace ij::map {

class ObstacleMap;

/// Cells to walk through, first step after the start up to and including
/// the goal. The start cell itself is never part of a path.
using Path = std::vector<GridCell>;

struct PathResult {
    bool found = false;
    Path cells;
    u32 nodes_expanded = 0; // nodes popped from the open list
};

/// A* over the 4-connected walkable grid with unit step cost.
class Pathfinder {
public:
    explicit Pathfinder(const ObstacleMap& obstacles);

    /// Shortest path from start to goal, or empty if the goal is blocked or
    /// unreachable.
    Path find_path(const GridCell& start, const GridCell& goal) const;

    /// Same search, also reporting how much of the grid was explored.
    PathResult search(const GridCell& start, const GridCell& goal) const;

private:
    const ObstacleMap& obstacles_;
};

} // namespace ij::map
