#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/lua_state.hpp"
#include "lua/world_loader.hpp"
#include "sim/world.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

static void print_usage() {
    std::cout << "IsoJourney v0.1.0\n"
              << "Headless driver for the isometric town navigation core\n\n"
              << "Usage:\n"
              << "  isojourney [options]\n\n"
              << "Options:\n"
              << "  --config <path>     World script (default: built-in town)\n"
              << "  --ticks <n>         Number of frames to run (default: 100)\n"
              << "  --frame-ms <ms>     Frame duration in milliseconds (default: 16)\n"
              << "  --goto <key>        Walk the patient to a structure's entry\n"
              << "  --click <sx> <sy>   Resolve a screen click and walk there\n"
              << "  --remove <key>      Remove a structure before moving\n"
              << "  --help              Show this help message\n";
}

static const char* parse_string_arg(int argc, char* argv[], const char* flag) {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], flag) == 0 && i + 1 < argc) {
            return argv[i + 1];
        }
    }
    return nullptr;
}

static bool parse_flag(int argc, char* argv[], const char* flag) {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], flag) == 0) return true;
    }
    return false;
}

static ij::u32 parse_ticks_arg(int argc, char* argv[]) {
    const char* arg = parse_string_arg(argc, argv, "--ticks");
    if (!arg) return 100;
    char* end = nullptr;
    long val = std::strtol(arg, &end, 10);
    if (end == arg || val < 0 || val > 1'000'000) {
        spdlog::error("Invalid --ticks value: {}", arg);
        std::exit(1);
    }
    return static_cast<ij::u32>(val);
}

static ij::f64 parse_frame_arg(int argc, char* argv[]) {
    const char* arg = parse_string_arg(argc, argv, "--frame-ms");
    if (!arg) return 16.0;
    char* end = nullptr;
    double val = std::strtod(arg, &end);
    if (end == arg || val <= 0 || val > 1000) {
        spdlog::error("Invalid --frame-ms value: {}", arg);
        std::exit(1);
    }
    return val;
}

static std::optional<ij::ScreenPoint> parse_click_arg(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--click") == 0 && i + 2 < argc) {
            char* end_x = nullptr;
            char* end_y = nullptr;
            float sx = std::strtof(argv[i + 1], &end_x);
            float sy = std::strtof(argv[i + 2], &end_y);
            if (end_x == argv[i + 1] || end_y == argv[i + 2]) {
                spdlog::error("Invalid --click value: {} {}", argv[i + 1],
                              argv[i + 2]);
                std::exit(1);
            }
            return ij::ScreenPoint{sx, sy};
        }
    }
    return std::nullopt;
}

int main(int argc, char* argv[]) {
    if (parse_flag(argc, argv, "--help")) {
        print_usage();
        return 0;
    }

    ij::log::init();

    const char* config_path = parse_string_arg(argc, argv, "--config");
    const char* goto_key = parse_string_arg(argc, argv, "--goto");
    const char* remove_key = parse_string_arg(argc, argv, "--remove");
    auto click = parse_click_arg(argc, argv);
    auto tick_count = parse_ticks_arg(argc, argv);
    auto frame_ms = parse_frame_arg(argc, argv);

    // World layout
    ij::sim::WorldConfig config = ij::sim::WorldConfig::defaults();
    if (config_path) {
        ij::lua::LuaState state;
        ij::lua::WorldLoader loader;
        auto loaded = loader.load_file(state, config_path);
        if (!loaded) {
            spdlog::error("World script failed ({}): {}",
                          ij::to_string(loaded.error().kind),
                          loaded.error().message);
            ij::log::shutdown();
            return 1;
        }
        config = std::move(loaded.value());
    }

    auto created = ij::sim::World::create(config);
    if (!created) {
        spdlog::error("World setup failed: {}", created.error().message);
        ij::log::shutdown();
        return 1;
    }
    auto world = std::move(created.value());

    if (remove_key) {
        auto* s = world->find_structure(std::string(remove_key));
        if (!s || !world->remove_structure(s->id())) {
            spdlog::warn("--remove: no structure '{}'", remove_key);
        }
    }

    ij::sim::Agent* patient = nullptr;
    world->registry().for_each_agent([&](ij::sim::Agent& a) {
        if (!patient) patient = &a;
    });
    if (!patient) {
        spdlog::error("World has no agent to move");
        ij::log::shutdown();
        return 1;
    }

    bool arrived = false;
    auto on_arrive = [&arrived, patient]() {
        arrived = true;
        const auto& c = patient->grid_position();
        spdlog::info("{} arrived at ({},{})", patient->name(), c.x, c.y);
    };

    bool moving = false;
    if (goto_key) {
        moving = world->travel_to(patient->id(), goto_key, on_arrive);
        if (!moving) spdlog::warn("No route to '{}'", goto_key);
    } else if (click) {
        auto cell = world->transform().to_grid(*click);
        auto picked = world->structure_at_click(*click);
        if (picked) {
            auto* s = world->find_structure(*picked);
            spdlog::info("Click ({}, {}) -> cell ({},{}) selects '{}'", click->x,
                         click->y, cell.x, cell.y, s->name());
            moving = world->travel_to(patient->id(), s->key(), on_arrive);
        } else {
            spdlog::info("Click ({}, {}) -> cell ({},{})", click->x, click->y,
                         cell.x, cell.y);
            moving = patient->motion().request_move(cell, on_arrive);
        }
        if (!moving) spdlog::warn("No route to clicked cell ({},{})", cell.x, cell.y);
    }

    // Fixed-step frame loop
    for (ij::u32 i = 0; i < tick_count; i++) {
        world->tick(frame_ms);
        const auto& motion = patient->motion();
        if (motion.is_walking() && world->tick_count() % 10 == 0) {
            const auto& p = motion.screen_position();
            spdlog::debug("Frame {}: cell ({},{}) screen ({:.1f}, {:.1f}) facing {}",
                          world->tick_count(), motion.cell().x, motion.cell().y,
                          p.x, p.y, ij::sim::to_string(motion.facing()));
        }
        if (moving && arrived) break;
    }

    const auto& motion = patient->motion();
    spdlog::info("After {} frames ({:.0f} ms): {} at ({},{}), {}",
                 world->tick_count(), world->elapsed_ms(), patient->name(),
                 motion.cell().x, motion.cell().y,
                 ij::sim::to_string(motion.state()));

    for (const auto* p : world->draw_order()) {
        auto cell = p->grid_position();
        spdlog::debug("  draw {:>18} depth {:6.1f} at ({},{})", p->name(),
                      p->depth_key(), cell.x, cell.y);
    }

    ij::log::shutdown();
    return (moving && !arrived) ? 2 : 0;
}
