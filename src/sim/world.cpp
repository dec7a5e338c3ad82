#include "sim/world.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace ij::sim {

namespace {

StructureSpec make_structure(std::string key, std::string name,
                             StructureKind kind, GridCell origin, i32 width,
                             i32 height) {
    StructureSpec spec;
    spec.key = std::move(key);
    spec.name = std::move(name);
    spec.kind = kind;
    spec.origin = origin;
    spec.width = width;
    spec.height = height;
    return spec;
}

} // namespace

WorldConfig WorldConfig::defaults() {
    WorldConfig config;
    // Clinic at the back (low y), pharmacy at the front (high y), home to
    // the west and lab to the east of the central crossing at (7,7).
    config.structures = {
        make_structure("clinic", "Fertility Clinic", StructureKind::Clinic,
                       {7, 2}, 3, 2),
        make_structure("home", "Home", StructureKind::Home, {3, 7}, 2, 2),
        make_structure("lab", "Embryology Lab", StructureKind::Lab, {11, 7}, 2, 2),
        make_structure("financing", "Financing", StructureKind::Pharmacy,
                       {7, 10}, 1, 1),
        make_structure("pharmacy", "Pharmacy", StructureKind::Pharmacy,
                       {7, 12}, 2, 2),
    };
    config.agents.push_back(AgentSpec{});
    return config;
}

Result<std::unique_ptr<World>> World::create(const WorldConfig& config) {
    auto valid_side = [](u32 n) {
        return n >= 1 && n <= WorldConfig::MAX_GRID_SIZE;
    };
    if (!valid_side(config.grid_width) || !valid_side(config.grid_height)) {
        return Error(ErrorKind::Config,
                     "grid " + std::to_string(config.grid_width) + "x" +
                         std::to_string(config.grid_height) +
                         " is outside 1.." +
                         std::to_string(WorldConfig::MAX_GRID_SIZE));
    }

    auto world = std::make_unique<World>(config.grid_width, config.grid_height,
                                         config.projection);

    for (const auto& spec : config.structures) {
        auto placed = world->place_structure(spec);
        if (!placed) return placed.error();
    }
    for (auto spec : config.agents) {
        spec.speed = config.move_speed;
        auto spawned = world->spawn_agent(std::move(spec));
        if (!spawned) return spawned.error();
    }

    spdlog::info("World: {}x{} grid, {} structures, {} agents",
                 world->obstacles_.width(), world->obstacles_.height(),
                 world->registry_.structure_count(),
                 world->registry_.agent_count());
    return world;
}

World::World(u32 grid_width, u32 grid_height,
             const map::IsoProjection& projection)
    : transform_(projection),
      obstacles_(grid_width, grid_height),
      pathfinder_(obstacles_) {}

World::~World() = default;

Result<u32> World::place_structure(StructureSpec spec) {
    if (spec.width <= 0 || spec.height <= 0) {
        return Error(ErrorKind::Placement,
                     "structure '" + spec.key + "' has an empty footprint");
    }

    const auto fp = Structure::footprint_of(spec);
    const GridCell far_corner{fp.origin.x + fp.width - 1,
                              fp.origin.y + fp.height - 1};
    if (!obstacles_.in_bounds(fp.origin) || !obstacles_.in_bounds(far_corner)) {
        return Error(ErrorKind::Placement,
                     "structure '" + spec.key + "' extends outside the grid");
    }

    // Overlapping footprints would share cells, and removing one would
    // unblock cells the other still covers.
    std::string conflict;
    registry_.for_each_structure([&](const Structure& other) {
        if (conflict.empty() && other.footprint()->overlaps(fp))
            conflict = "structure '" + spec.key + "' overlaps '" + other.key() + "'";
    });
    registry_.for_each_agent([&](const Agent& agent) {
        if (conflict.empty() && fp.contains(agent.grid_position()))
            conflict = "structure '" + spec.key + "' covers agent '" +
                       agent.name() + "'";
    });
    if (!conflict.empty()) {
        spdlog::warn("World: {}", conflict);
        return Error(ErrorKind::Placement, std::move(conflict));
    }

    auto structure = std::make_unique<Structure>(std::move(spec), obstacles_);
    const auto* raw = structure.get();
    u32 id = registry_.register_structure(std::move(structure));
    spdlog::info("World: placed '{}' ({}) at ({},{}) size {}x{}, entry ({},{})",
                 raw->name(), to_string(raw->structure_kind()), fp.origin.x,
                 fp.origin.y, fp.width, fp.height, raw->entry_point().x,
                 raw->entry_point().y);
    return id;
}

bool World::remove_structure(u32 id) {
    auto* s = registry_.find_structure(id);
    if (!s) {
        spdlog::warn("World: remove_structure({}) - no such structure", id);
        return false;
    }
    spdlog::info("World: removing '{}'", s->name());
    return registry_.unregister_structure(id);
}

Result<u32> World::spawn_agent(AgentSpec spec) {
    if (!obstacles_.is_walkable(spec.start)) {
        return Error(ErrorKind::Placement,
                     "agent '" + spec.name + "' cannot start on (" +
                         std::to_string(spec.start.x) + "," +
                         std::to_string(spec.start.y) + ")");
    }
    auto agent = std::make_unique<Agent>(std::move(spec), pathfinder_, transform_);
    const auto* raw = agent.get();
    u32 id = registry_.register_agent(std::move(agent));
    spdlog::info("World: spawned '{}' at ({},{})", raw->name(),
                 raw->grid_position().x, raw->grid_position().y);
    return id;
}

bool World::travel_to(u32 agent_id, const std::string& structure_key,
                      MotionController::ArriveCallback on_arrive) {
    auto* agent = registry_.find_agent(agent_id);
    auto* target = registry_.find_structure_by_key(structure_key);
    if (!agent || !target) {
        spdlog::warn("World: travel_to({}, '{}') - unknown agent or structure",
                     agent_id, structure_key);
        return false;
    }
    return agent->motion().request_move(target->entry_point(),
                                        std::move(on_arrive));
}

std::optional<u32> World::structure_at_click(const ScreenPoint& click) const {
    const GridCell cell = transform_.to_grid(click);
    auto ids = registry_.collect_entries_near(cell, CLICK_RADIUS);
    if (ids.empty()) return std::nullopt;
    return ids.front();
}

void World::tick(f64 dt_ms) {
    tick_count_++;
    elapsed_ms_ += dt_ms;

    // Snapshot ids: an arrival callback may spawn or remove agents.
    std::vector<u32> ids;
    ids.reserve(registry_.agent_count());
    registry_.for_each_agent([&](const Agent& a) { ids.push_back(a.id()); });

    for (u32 id : ids) {
        if (auto* agent = registry_.find_agent(id)) agent->update(dt_ms);
    }
}

std::vector<const Placeable*> World::draw_order() const {
    auto items = registry_.all_placeables();
    std::stable_sort(items.begin(), items.end(),
                     [](const Placeable* a, const Placeable* b) {
                         return a->depth_key() < b->depth_key();
                     });
    return items;
}

} // namespace ij::sim
