#include "map/pathfinder.hpp"
#include "map/coordinate_transform.hpp"
#include "map/obstacle_map.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace ij::map {

namespace {

constexpr u32 NO_NODE = UINT32_MAX;

struct SearchNode {
    GridCell cell;
    i32 g = 0;
    i32 h = 0;
    i32 f = 0;
    u32 parent = NO_NODE; // index into the node arena
};

} // namespace

Pathfinder::Pathfinder(const ObstacleMap& obstacles) : obstacles_(obstacles) {}

Path Pathfinder::find_path(const GridCell& start, const GridCell& goal) const {
    return search(start, goal).cells;
}

PathResult Pathfinder::search(const GridCell& start,
                              const GridCell& goal) const {
    PathResult result;

    if (!obstacles_.is_walkable(goal)) {
        spdlog::debug("Pathfinder: goal ({},{}) is not walkable", goal.x, goal.y);
        return result;
    }
    if (!obstacles_.in_bounds(start)) {
        spdlog::warn("Pathfinder: start ({},{}) outside {}x{} grid", start.x,
                     start.y, obstacles_.width(), obstacles_.height());
        return result;
    }

    const size_t w = obstacles_.width();
    const size_t total = w * obstacles_.height();
    auto idx = [w](const GridCell& c) -> size_t {
        return static_cast<size_t>(c.y) * w + static_cast<size_t>(c.x);
    };

    // Node arena owned by this call; parents are arena indices.
    std::vector<SearchNode> nodes;
    std::vector<u32> node_of_cell(total, NO_NODE);
    std::vector<bool> closed(total, false);

    // Open list kept in insertion order. Selecting the first minimum keeps
    // equal-f ties resolved by insertion, so results are reproducible.
    std::vector<u32> open;

    SearchNode start_node;
    start_node.cell = start;
    start_node.h = CoordinateTransform::manhattan(start, goal);
    start_node.f = start_node.h;
    nodes.push_back(start_node);
    node_of_cell[idx(start)] = 0;
    open.push_back(0);

    while (!open.empty()) {
        auto best = open.begin();
        for (auto it = open.begin() + 1; it != open.end(); ++it) {
            if (nodes[*it].f < nodes[*best].f) best = it;
        }
        const u32 cur = *best;
        open.erase(best);
        ++result.nodes_expanded;

        const GridCell cur_cell = nodes[cur].cell;
        if (cur_cell == goal) {
            for (u32 n = cur; nodes[n].parent != NO_NODE; n = nodes[n].parent) {
                result.cells.push_back(nodes[n].cell);
            }
            std::reverse(result.cells.begin(), result.cells.end());
            result.found = true;
            spdlog::debug("Pathfinder: ({},{}) -> ({},{}) in {} steps, {} nodes",
                          start.x, start.y, goal.x, goal.y, result.cells.size(),
                          result.nodes_expanded);
            return result;
        }

        closed[idx(cur_cell)] = true;

        for (const auto& next : CoordinateTransform::neighbors(cur_cell)) {
            if (!obstacles_.is_walkable(next)) continue;
            const size_t cell_idx = idx(next);
            if (closed[cell_idx]) continue;

            const i32 g = nodes[cur].g + 1;
            const u32 existing = node_of_cell[cell_idx];

            if (existing == NO_NODE) {
                SearchNode node;
                node.cell = next;
                node.g = g;
                node.h = CoordinateTransform::manhattan(next, goal);
                node.f = g + node.h;
                node.parent = cur;
                node_of_cell[cell_idx] = static_cast<u32>(nodes.size());
                open.push_back(static_cast<u32>(nodes.size()));
                nodes.push_back(node);
            } else if (g < nodes[existing].g) {
                // Decrease-key in place; position in the open list is kept.
                nodes[existing].g = g;
                nodes[existing].f = g + nodes[existing].h;
                nodes[existing].parent = cur;
            }
        }
    }

    spdlog::debug("Pathfinder: no path from ({},{}) to ({},{}) after {} nodes",
                  start.x, start.y, goal.x, goal.y, result.nodes_expanded);
    return result;
}

} // namespace ij::map
