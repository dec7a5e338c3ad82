#pragma once

#include "core/types.hpp"
#include "map/pathfinder.hpp" // Path

#include <functional>

namespace ij::map {
class CoordinateTransform;
}

namespace ij::sim {

enum class MotionState : u8 { Idle, Walking, Busy };

enum class Facing : u8 { North, South, East, West };

const char* to_string(MotionState state);
const char* to_string(Facing facing);

/// Walks one agent along a grid path, converting discrete waypoints into
/// per-frame screen displacement. Reaches at most one waypoint per tick.
class MotionController {
public:
    using ArriveCallback = std::function<void()>;

    static constexpr f32 DEFAULT_SPEED = 100.0f; // pixels per second

    MotionController(const map::Pathfinder& pathfinder,
                     const map::CoordinateTransform& transform,
                     GridCell start, f32 speed = DEFAULT_SPEED);

    /// Find a path to goal and start walking it. Returns false (and leaves
    /// everything untouched) when busy or when no path exists.
    bool request_move(const GridCell& goal, ArriveCallback on_arrive = {});

    /// Advance toward the current waypoint. No-op unless walking, or when
    /// dt_ms is not positive.
    void tick(f64 dt_ms);

    /// Drop the path and go idle without firing the arrival callback.
    void stop();

    void set_busy(bool busy);

    /// Place the agent on a cell instantly, dropping any path.
    void teleport(const GridCell& cell);

    MotionState state() const { return state_; }
    bool is_walking() const { return state_ == MotionState::Walking; }
    Facing facing() const { return facing_; }
    const GridCell& cell() const { return cell_; }
    const ScreenPoint& screen_position() const { return screen_pos_; }
    f32 speed() const { return speed_; }

    size_t remaining_waypoints() const {
        return path_.size() > cursor_ ? path_.size() - cursor_ : 0;
    }

    /// Final cell of the active path, or the current cell when idle.
    GridCell goal() const { return path_.empty() ? cell_ : path_.back(); }

private:
    void clear_path();
    void update_facing(const GridCell& waypoint);

    const map::Pathfinder& pathfinder_;
    const map::CoordinateTransform& transform_;

    MotionState state_ = MotionState::Idle;
    Facing facing_ = Facing::South;
    GridCell cell_;
    ScreenPoint screen_pos_;
    f32 speed_;

    map::Path path_;
    size_t cursor_ = 0;
    ArriveCallback on_arrive_;
};

} // namespace ij::sim
