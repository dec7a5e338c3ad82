#pragma once

#include "core/result.hpp"
#include "map/coordinate_transform.hpp"
#include "map/obstacle_map.hpp"
#include "map/pathfinder.hpp"
#include "sim/agent.hpp"
#include "sim/entity_registry.hpp"
#include "sim/structure.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ij::sim {

/// Fixed constants and initial layout of a world.
struct WorldConfig {
    /// Largest accepted grid side. Keeps per-search arrays bounded.
    static constexpr u32 MAX_GRID_SIZE = 4096;

    u32 grid_width = 20;
    u32 grid_height = 20;
    map::IsoProjection projection;
    f32 move_speed = MotionController::DEFAULT_SPEED;
    std::vector<StructureSpec> structures;
    std::vector<AgentSpec> agents;

    /// The stock town: clinic, home, lab, financing office and pharmacy
    /// around a central crossing, with the patient standing on it.
    static WorldConfig defaults();
};

class World {
public:
    /// Clicks within this Manhattan distance of an entry select the structure.
    static constexpr i32 CLICK_RADIUS = 3;

    /// Build the grid and place every configured structure and agent.
    /// Fails on a grid outside [1, MAX_GRID_SIZE] or on the first rejected
    /// placement.
    static Result<std::unique_ptr<World>> create(const WorldConfig& config);

    World(u32 grid_width, u32 grid_height, const map::IsoProjection& projection);
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    const map::ObstacleMap& obstacles() const { return obstacles_; }
    const map::CoordinateTransform& transform() const { return transform_; }
    const EntityRegistry& registry() const { return registry_; }

    /// Place a structure and block its footprint. Rejects footprints that
    /// leave the grid, overlap another structure or cover an agent.
    Result<u32> place_structure(StructureSpec spec);

    /// Destroy a structure, unblocking its footprint.
    bool remove_structure(u32 id);

    /// Add an agent on a walkable cell.
    Result<u32> spawn_agent(AgentSpec spec);

    Structure* find_structure(u32 id) const { return registry_.find_structure(id); }
    Structure* find_structure(const std::string& key) const {
        return registry_.find_structure_by_key(key);
    }
    Agent* find_agent(u32 id) const { return registry_.find_agent(id); }

    /// Send an agent to a structure's entry point.
    bool travel_to(u32 agent_id, const std::string& structure_key,
                   MotionController::ArriveCallback on_arrive = {});

    /// Resolve a screen click to the first structure whose entry is near the
    /// clicked cell.
    std::optional<u32> structure_at_click(const ScreenPoint& click) const;

    /// Advance every agent once, in registration order.
    void tick(f64 dt_ms);
    u32 tick_count() const { return tick_count_; }
    f64 elapsed_ms() const { return elapsed_ms_; }

    /// All placeables sorted back to front.
    std::vector<const Placeable*> draw_order() const;

private:
    // Declaration order matters: structures and agents hold references to
    // the map, pathfinder and transform and must be destroyed first.
    map::CoordinateTransform transform_;
    map::ObstacleMap obstacles_;
    map::Pathfinder pathfinder_;
    EntityRegistry registry_;
    u32 tick_count_ = 0;
    f64 elapsed_ms_ = 0.0;
};

} // namespace ij::sim
