#include "sim/agent.hpp"
#include "map/coordinate_transform.hpp"

namespace ij::sim {

Agent::Agent(AgentSpec spec, const map::Pathfinder& pathfinder,
             const map::CoordinateTransform& transform)
    : name_(std::move(spec.name)),
      transform_(transform),
      motion_(pathfinder, transform, spec.start, spec.speed) {}

f32 Agent::depth_key() const {
    f32 gx = 0.0f, gy = 0.0f;
    transform_.to_grid_fractional(motion_.screen_position(), gx, gy);
    return map::CoordinateTransform::depth_key(gx, gy);
}

} // namespace ij::sim
