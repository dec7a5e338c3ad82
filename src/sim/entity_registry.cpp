#include "sim/entity_registry.hpp"
#include "map/coordinate_transform.hpp"
#include "sim/agent.hpp"
#include "sim/structure.hpp"

namespace ij::sim {

EntityRegistry::EntityRegistry() = default;
EntityRegistry::~EntityRegistry() = default;

u32 EntityRegistry::register_structure(std::unique_ptr<Structure> structure) {
    u32 id = next_id_++;
    structure->set_id(id);
    structures_[id] = std::move(structure);
    return id;
}

u32 EntityRegistry::register_agent(std::unique_ptr<Agent> agent) {
    u32 id = next_id_++;
    agent->set_id(id);
    agents_[id] = std::move(agent);
    return id;
}

bool EntityRegistry::unregister_structure(u32 id) {
    return structures_.erase(id) > 0;
}

Structure* EntityRegistry::find_structure(u32 id) const {
    auto it = structures_.find(id);
    return it != structures_.end() ? it->second.get() : nullptr;
}

Agent* EntityRegistry::find_agent(u32 id) const {
    auto it = agents_.find(id);
    return it != agents_.end() ? it->second.get() : nullptr;
}

Structure* EntityRegistry::find_structure_by_key(const std::string& key) const {
    for (const auto& [id, s] : structures_) {
        if (s->key() == key) return s.get();
    }
    return nullptr;
}

std::vector<u32> EntityRegistry::collect_entries_near(const GridCell& cell,
                                                      i32 radius) const {
    std::vector<u32> result;
    for (const auto& [id, s] : structures_) {
        if (map::CoordinateTransform::manhattan(s->entry_point(), cell) <= radius)
            result.push_back(id);
    }
    return result;
}

std::vector<const Placeable*> EntityRegistry::all_placeables() const {
    std::vector<const Placeable*> result;
    result.reserve(structures_.size() + agents_.size());
    for (const auto& [id, s] : structures_)
        result.push_back(s.get());
    for (const auto& [id, a] : agents_)
        result.push_back(a.get());
    return result;
}

} // namespace ij::sim
