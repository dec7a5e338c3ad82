#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "lua/lua_state.hpp"
#include "lua/world_loader.hpp"

extern "C" {
#include <lua.h>
}

using namespace ij;
using namespace ij::lua;
using Catch::Matchers::WithinAbs;

TEST_CASE("World script with every field", "[lua]") {
    LuaState state;
    WorldLoader loader;

    auto result = loader.load_string(state, R"(
        world = {
            grid = { width = 12, height = 8 },
            tile = { width = 32, height = 16 },
            offset = { x = 10, y = 20 },
            move_speed = 250,
            structures = {
                { key = "clinic", name = "Clinic", kind = "clinic",
                  x = 2, y = 1, width = 3, height = 2 },
                { key = "shed", kind = "home", x = 8, y = 5, width = 1, height = 1,
                  entry = { x = -1, y = 0 } },
            },
            agent = { name = "Walker", x = 0, y = 7 },
        }
    )");
    REQUIRE(result.ok());
    const auto& config = result.value();

    CHECK(config.grid_width == 12);
    CHECK(config.grid_height == 8);
    CHECK_THAT(config.projection.tile_width, WithinAbs(32.0, 0.001));
    CHECK_THAT(config.projection.tile_height, WithinAbs(16.0, 0.001));
    CHECK_THAT(config.projection.x_offset, WithinAbs(10.0, 0.001));
    CHECK_THAT(config.projection.y_offset, WithinAbs(20.0, 0.001));
    CHECK_THAT(config.move_speed, WithinAbs(250.0, 0.001));

    REQUIRE(config.structures.size() == 2);
    CHECK(config.structures[0].key == "clinic");
    CHECK(config.structures[0].name == "Clinic");
    CHECK(config.structures[0].kind == sim::StructureKind::Clinic);
    CHECK(config.structures[0].origin == GridCell{2, 1});
    CHECK(config.structures[0].width == 3);
    CHECK_FALSE(config.structures[0].entry_offset.has_value());

    CHECK(config.structures[1].name == "shed"); // name falls back to key
    REQUIRE(config.structures[1].entry_offset.has_value());
    CHECK(*config.structures[1].entry_offset == GridCell{-1, 0});

    REQUIRE(config.agents.size() == 1);
    CHECK(config.agents[0].name == "Walker");
    CHECK(config.agents[0].start == GridCell{0, 7});

    // The loaded layout builds a working world
    auto world = sim::World::create(config);
    REQUIRE(world.ok());
    CHECK(world.value()->find_structure("shed")->entry_point() == GridCell{7, 5});
    world.value()->registry().for_each_agent([](const sim::Agent& a) {
        CHECK_THAT(a.motion().speed(), WithinAbs(250.0, 0.001));
    });
}

TEST_CASE("Omitted fields keep the stock town", "[lua]") {
    LuaState state;
    WorldLoader loader;

    auto result = loader.load_string(state, "world = { move_speed = 80 }");
    REQUIRE(result.ok());
    const auto& config = result.value();
    auto defaults = sim::WorldConfig::defaults();

    CHECK(config.grid_width == defaults.grid_width);
    CHECK(config.structures.size() == defaults.structures.size());
    CHECK(config.agents.size() == 1);
    CHECK_THAT(config.move_speed, WithinAbs(80.0, 0.001));
    CHECK_THAT(config.projection.x_offset, WithinAbs(632.0, 0.001));
}

TEST_CASE("An empty structure list clears the town", "[lua]") {
    LuaState state;
    WorldLoader loader;

    auto result = loader.load_string(state, "world = { structures = {} }");
    REQUIRE(result.ok());
    CHECK(result.value().structures.empty());
}

TEST_CASE("World script errors", "[lua]") {
    LuaState state;
    WorldLoader loader;

    SECTION("no world table") {
        auto r = loader.load_string(state, "x = 1");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Config);
    }
    SECTION("syntax error") {
        auto r = loader.load_string(state, "world = {");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Script);
    }
    SECTION("wrong field type") {
        auto r = loader.load_string(state, "world = { grid = { width = 'wide' } }");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Config);
        CHECK(r.error().message.find("world.grid.width") != std::string::npos);
    }
    SECTION("unknown structure kind") {
        auto r = loader.load_string(state, R"(
            world = { structures = { { key = "x", kind = "castle", x = 1, y = 1 } } }
        )");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().message.find("castle") != std::string::npos);
    }
    SECTION("structure without a position") {
        auto r = loader.load_string(state, R"(
            world = { structures = { { key = "x" } } }
        )");
        REQUIRE_FALSE(r.ok());
    }
    SECTION("structure without a key") {
        auto r = loader.load_string(state, R"(
            world = { structures = { { x = 1, y = 1 } } }
        )");
        REQUIRE_FALSE(r.ok());
    }
    SECTION("zero-sized grid") {
        auto r = loader.load_string(state, "world = { grid = { width = 0 } }");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Config);
    }
    SECTION("negative grid width") {
        auto r = loader.load_string(state, "world = { grid = { width = -20 } }");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Config);
        CHECK(r.error().message.find("world.grid.width") != std::string::npos);
    }
    SECTION("grid wider than supported") {
        auto r = loader.load_string(state, "world = { grid = { width = 65536 } }");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Config);
    }
    SECTION("fractional grid height") {
        auto r = loader.load_string(state, "world = { grid = { height = 12.5 } }");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Config);
    }
    SECTION("fractional structure position") {
        auto r = loader.load_string(state, R"(
            world = { structures = { { key = "x", x = 7.5, y = 1 } } }
        )");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().message.find("world.structures[1].x") != std::string::npos);
    }
    SECTION("huge structure position") {
        auto r = loader.load_string(state, R"(
            world = { structures = { { key = "x", x = 1, y = 1e12 } } }
        )");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Config);
    }
    SECTION("fractional entry offset") {
        auto r = loader.load_string(state, R"(
            world = { structures = { { key = "x", x = 1, y = 1,
                                       entry = { x = 0.5, y = 2 } } } }
        )");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Config);
    }
    SECTION("negative agent position") {
        auto r = loader.load_string(state, "world = { agent = { x = -1, y = 3 } }");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().message.find("world.agent.x") != std::string::npos);
    }

    // A failed load leaves the Lua stack balanced
    CHECK(lua_gettop(state.raw()) == 0);
}

TEST_CASE("Bundled world script matches the built-in town", "[lua]") {
    LuaState state;
    WorldLoader loader;

    auto result = loader.load_file(state, fs::path(ISOJOURNEY_SCRIPTS_DIR) / "world.lua");
    REQUIRE(result.ok());
    const auto& config = result.value();
    auto defaults = sim::WorldConfig::defaults();

    REQUIRE(config.structures.size() == defaults.structures.size());
    for (size_t i = 0; i < defaults.structures.size(); ++i) {
        CHECK(config.structures[i].key == defaults.structures[i].key);
        CHECK(config.structures[i].origin == defaults.structures[i].origin);
        CHECK(config.structures[i].width == defaults.structures[i].width);
        CHECK(config.structures[i].height == defaults.structures[i].height);
    }
    REQUIRE(config.agents.size() == 1);
    CHECK(config.agents[0].start == GridCell{7, 7});
}
