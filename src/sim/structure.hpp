#pragma once

#include "sim/placeable.hpp"

#include <optional>
#include <string>

namespace ij::map {
class ObstacleMap;
}

namespace ij::sim {

enum class StructureKind : u8 { Home, Clinic, Pharmacy, Lab, Hospital };

const char* to_string(StructureKind kind);
std::optional<StructureKind> structure_kind_from_string(const std::string& s);

/// Everything needed to place a structure.
struct StructureSpec {
    std::string key;  // lookup handle, e.g. "clinic"
    std::string name; // display name
    StructureKind kind = StructureKind::Home;
    GridCell origin;
    i32 width = 2;
    i32 height = 2;
    /// Entry cell relative to origin. Defaults to the middle of the front
    /// edge, one row past the footprint.
    std::optional<GridCell> entry_offset;
};

/// Static building. Blocks its footprint for exactly as long as it lives.
class Structure : public Placeable {
public:
    Structure(StructureSpec spec, map::ObstacleMap& obstacles);
    ~Structure() override;

    Structure(const Structure&) = delete;
    Structure& operator=(const Structure&) = delete;

    u32 id() const { return id_; }
    void set_id(u32 id) { id_ = id; }

    const std::string& name() const override { return spec_.name; }
    GridCell grid_position() const override { return spec_.origin; }
    f32 depth_key() const override;
    std::optional<map::Footprint> footprint() const override {
        return footprint_;
    }

    const std::string& key() const { return spec_.key; }
    StructureKind structure_kind() const { return spec_.kind; }
    const GridCell& entry_point() const { return entry_; }

    /// Fractional grid coordinate of the footprint center.
    f32 anchor_x() const;
    f32 anchor_y() const;

    static map::Footprint footprint_of(const StructureSpec& spec) {
        return {spec.origin, spec.width, spec.height};
    }
    static GridCell entry_point_of(const StructureSpec& spec);

private:
    StructureSpec spec_;
    map::Footprint footprint_;
    GridCell entry_;
    map::ObstacleMap& obstacles_;
    u32 id_ = 0;
};

} // namespace ij::sim
