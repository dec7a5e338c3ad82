#pragma once

#include "core/types.hpp"
#include "map/obstacle_map.hpp" // Footprint

#include <optional>
#include <string>

namespace ij::sim {

/// Capability shared by everything that sits on the grid and gets drawn.
/// Only structures report a footprint.
class Placeable {
public:
    virtual ~Placeable() = default;

    virtual const std::string& name() const = 0;

    /// Cell the object is logically standing on.
    virtual GridCell grid_position() const = 0;

    /// Back-to-front paint key, see CoordinateTransform::depth_key.
    virtual f32 depth_key() const = 0;

    virtual std::optional<map::Footprint> footprint() const {
        return std::nullopt;
    }
};

} // namespace ij::sim
