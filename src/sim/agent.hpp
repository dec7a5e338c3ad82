#pragma once

#include "sim/motion_controller.hpp"
#include "sim/placeable.hpp"

#include <string>

namespace ij::sim {

struct AgentSpec {
    std::string name = "Patient";
    GridCell start{7, 7};
    f32 speed = MotionController::DEFAULT_SPEED;
};

/// Controllable walker. Has no footprint and never touches the obstacle map.
class Agent : public Placeable {
public:
    Agent(AgentSpec spec, const map::Pathfinder& pathfinder,
          const map::CoordinateTransform& transform);

    u32 id() const { return id_; }
    void set_id(u32 id) { id_ = id; }

    const std::string& name() const override { return name_; }
    GridCell grid_position() const override { return motion_.cell(); }
    /// Follows the render position, so a walking agent re-sorts mid-step.
    f32 depth_key() const override;

    MotionController& motion() { return motion_; }
    const MotionController& motion() const { return motion_; }

    void update(f64 dt_ms) { motion_.tick(dt_ms); }

private:
    std::string name_;
    const map::CoordinateTransform& transform_;
    MotionController motion_;
    u32 id_ = 0;
};

} // namespace ij::sim
