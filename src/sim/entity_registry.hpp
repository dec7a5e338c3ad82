#pragma once

#include "core/types.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ij::sim {

class Agent;
class Placeable;
class Structure;

/// Owns structures and agents, keyed by ids handed out in placement order.
/// Iteration follows id order so per-frame updates are deterministic.
class EntityRegistry {
public:
    EntityRegistry();
    ~EntityRegistry();

    /// Take ownership and assign a unique ID. Returns the ID.
    u32 register_structure(std::unique_ptr<Structure> structure);
    u32 register_agent(std::unique_ptr<Agent> agent);

    /// Destroying the structure releases its footprint. Returns false if the
    /// id is unknown.
    bool unregister_structure(u32 id);

    /// Look up by ID. Returns nullptr if not found.
    Structure* find_structure(u32 id) const;
    Agent* find_agent(u32 id) const;
    Structure* find_structure_by_key(const std::string& key) const;

    size_t structure_count() const { return structures_.size(); }
    size_t agent_count() const { return agents_.size(); }

    /// Structure IDs whose entry point is within a Manhattan radius of cell.
    std::vector<u32> collect_entries_near(const GridCell& cell,
                                          i32 radius) const;

    /// Everything on the grid, in id order (structures first).
    std::vector<const Placeable*> all_placeables() const;

    template <typename F>
    void for_each_structure(F&& fn) const {
        for (const auto& [id, s] : structures_)
            fn(*s);
    }

    template <typename F>
    void for_each_agent(F&& fn) const {
        for (const auto& [id, a] : agents_)
            fn(*a);
    }

private:
    std::map<u32, std::unique_ptr<Structure>> structures_;
    std::map<u32, std::unique_ptr<Agent>> agents_;
    u32 next_id_ = 1;
};

} // namespace ij::sim
