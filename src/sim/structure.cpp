#include "sim/structure.hpp"
#include "map/coordinate_transform.hpp"
#include "map/obstacle_map.hpp"

#include <spdlog/spdlog.h>

namespace ij::sim {

const char* to_string(StructureKind kind) {
    switch (kind) {
    case StructureKind::Home: return "home";
    case StructureKind::Clinic: return "clinic";
    case StructureKind::Pharmacy: return "pharmacy";
    case StructureKind::Lab: return "lab";
    case StructureKind::Hospital: return "hospital";
    }
    return "unknown";
}

std::optional<StructureKind> structure_kind_from_string(const std::string& s) {
    if (s == "home") return StructureKind::Home;
    if (s == "clinic") return StructureKind::Clinic;
    if (s == "pharmacy") return StructureKind::Pharmacy;
    if (s == "lab") return StructureKind::Lab;
    if (s == "hospital") return StructureKind::Hospital;
    return std::nullopt;
}

GridCell Structure::entry_point_of(const StructureSpec& spec) {
    if (spec.entry_offset) {
        return {spec.origin.x + spec.entry_offset->x,
                spec.origin.y + spec.entry_offset->y};
    }
    return {spec.origin.x + spec.width / 2, spec.origin.y + spec.height};
}

Structure::Structure(StructureSpec spec, map::ObstacleMap& obstacles)
    : spec_(std::move(spec)),
      footprint_(footprint_of(spec_)),
      entry_(entry_point_of(spec_)),
      obstacles_(obstacles) {
    obstacles_.block_footprint(footprint_);
    spdlog::debug("Structure '{}': blocked {}x{} at ({},{})", spec_.key,
                  footprint_.width, footprint_.height, footprint_.origin.x,
                  footprint_.origin.y);
}

Structure::~Structure() {
    obstacles_.unblock_footprint(footprint_);
    spdlog::debug("Structure '{}': released footprint", spec_.key);
}

f32 Structure::anchor_x() const {
    return static_cast<f32>(spec_.origin.x) + static_cast<f32>(spec_.width) * 0.5f;
}

f32 Structure::anchor_y() const {
    return static_cast<f32>(spec_.origin.y) + static_cast<f32>(spec_.height) * 0.5f;
}

f32 Structure::depth_key() const {
    return map::CoordinateTransform::depth_key(anchor_x(), anchor_y());
}

} // namespace ij::sim
