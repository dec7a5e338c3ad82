#include "sim/motion_controller.hpp"
#include "map/coordinate_transform.hpp"

#include <cmath>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace ij::sim {

const char* to_string(MotionState state) {
    switch (state) {
    case MotionState::Idle: return "idle";
    case MotionState::Walking: return "walking";
    case MotionState::Busy: return "busy";
    }
    return "unknown";
}

const char* to_string(Facing facing) {
    switch (facing) {
    case Facing::North: return "north";
    case Facing::South: return "south";
    case Facing::East: return "east";
    case Facing::West: return "west";
    }
    return "unknown";
}

MotionController::MotionController(const map::Pathfinder& pathfinder,
                                   const map::CoordinateTransform& transform,
                                   GridCell start, f32 speed)
    : pathfinder_(pathfinder),
      transform_(transform),
      cell_(start),
      screen_pos_(transform.to_screen(start)),
      speed_(speed) {}

bool MotionController::request_move(const GridCell& goal,
                                    ArriveCallback on_arrive) {
    if (state_ == MotionState::Busy) {
        spdlog::debug("MotionController: move to ({},{}) rejected while busy",
                      goal.x, goal.y);
        return false;
    }

    auto path = pathfinder_.find_path(cell_, goal);
    if (path.empty()) {
        spdlog::debug("MotionController: no path from ({},{}) to ({},{})",
                      cell_.x, cell_.y, goal.x, goal.y);
        return false;
    }

    // Replace the active path wholesale; nothing is queued.
    path_ = std::move(path);
    cursor_ = 0;
    on_arrive_ = std::move(on_arrive);
    state_ = MotionState::Walking;
    spdlog::debug("MotionController: walking {} steps to ({},{})", path_.size(),
                  goal.x, goal.y);
    return true;
}

void MotionController::tick(f64 dt_ms) {
    if (state_ != MotionState::Walking || speed_ <= 0 || dt_ms <= 0) return;
    if (cursor_ >= path_.size()) {
        clear_path();
        state_ = MotionState::Idle;
        return;
    }

    const GridCell waypoint = path_[cursor_];
    const ScreenPoint target = transform_.to_screen(waypoint);
    update_facing(waypoint);

    const f32 dx = target.x - screen_pos_.x;
    const f32 dy = target.y - screen_pos_.y;
    const f32 dist = std::sqrt(dx * dx + dy * dy);
    const f32 step = speed_ * static_cast<f32>(dt_ms / 1000.0);

    if (dist > step) {
        const f32 ratio = step / dist;
        screen_pos_.x += dx * ratio;
        screen_pos_.y += dy * ratio;
        return;
    }

    // Reached this waypoint: snap, never overshoot.
    cell_ = waypoint;
    screen_pos_ = target;
    ++cursor_;

    if (cursor_ >= path_.size()) {
        state_ = MotionState::Idle;
        clear_path();
        spdlog::debug("MotionController: arrived at ({},{})", cell_.x, cell_.y);

        // Take the callback out first so it can issue a new request_move.
        auto on_arrive = std::move(on_arrive_);
        on_arrive_ = nullptr;
        if (on_arrive) on_arrive();
    }
}

void MotionController::stop() {
    clear_path();
    on_arrive_ = nullptr;
    state_ = MotionState::Idle;
}

void MotionController::set_busy(bool busy) {
    if (busy) {
        clear_path();
        on_arrive_ = nullptr;
        state_ = MotionState::Busy;
    } else if (state_ == MotionState::Busy) {
        state_ = MotionState::Idle;
    }
}

void MotionController::teleport(const GridCell& cell) {
    clear_path();
    on_arrive_ = nullptr;
    if (state_ == MotionState::Walking) state_ = MotionState::Idle;
    cell_ = cell;
    screen_pos_ = transform_.to_screen(cell);
}

void MotionController::clear_path() {
    path_.clear();
    cursor_ = 0;
}

void MotionController::update_facing(const GridCell& waypoint) {
    const i32 dx = waypoint.x - cell_.x;
    const i32 dy = waypoint.y - cell_.y;
    if (dx == 0 && dy == 0) return;

    // Horizontal wins ties.
    if (std::abs(dx) >= std::abs(dy)) {
        facing_ = dx > 0 ? Facing::East : Facing::West;
    } else {
        facing_ = dy > 0 ? Facing::South : Facing::North;
    }
}

} // namespace ij::sim
