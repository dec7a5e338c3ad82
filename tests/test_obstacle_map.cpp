#include <catch2/catch_test_macros.hpp>

#include "map/obstacle_map.hpp"

using namespace ij;
using namespace ij::map;

TEST_CASE("Fresh map is walkable everywhere inside bounds", "[map]") {
    ObstacleMap obstacles(20, 20);
    CHECK(obstacles.width() == 20);
    CHECK(obstacles.height() == 20);
    CHECK(obstacles.is_walkable({0, 0}));
    CHECK(obstacles.is_walkable({19, 19}));
    CHECK(obstacles.blocked_count() == 0);

    CHECK_FALSE(obstacles.is_walkable({-1, 0}));
    CHECK_FALSE(obstacles.is_walkable({0, -1}));
    CHECK_FALSE(obstacles.is_walkable({20, 5}));
    CHECK_FALSE(obstacles.is_walkable({5, 20}));
}

TEST_CASE("Block and unblock are idempotent", "[map]") {
    ObstacleMap obstacles(10, 10);

    obstacles.block({3, 4});
    obstacles.block({3, 4});
    CHECK_FALSE(obstacles.is_walkable({3, 4}));
    CHECK(obstacles.blocked_count() == 1);

    obstacles.unblock({3, 4});
    CHECK(obstacles.is_walkable({3, 4}));
    obstacles.unblock({3, 4});
    CHECK(obstacles.is_walkable({3, 4}));
    CHECK(obstacles.blocked_count() == 0);
}

TEST_CASE("Unblocking an open cell leaves other cells alone", "[map]") {
    ObstacleMap obstacles(10, 10);
    obstacles.block({1, 1});
    obstacles.block({2, 1});

    obstacles.unblock({5, 5});
    CHECK(obstacles.is_blocked({1, 1}));
    CHECK(obstacles.is_blocked({2, 1}));
    CHECK(obstacles.blocked_count() == 2);
}

TEST_CASE("Footprint blocks every covered cell", "[map]") {
    ObstacleMap obstacles(20, 20);
    Footprint clinic{{7, 2}, 3, 2};

    obstacles.block_footprint(clinic);
    CHECK(obstacles.blocked_count() == 6);
    for (i32 y = 2; y <= 3; ++y) {
        for (i32 x = 7; x <= 9; ++x) {
            CHECK_FALSE(obstacles.is_walkable({x, y}));
        }
    }
    CHECK(obstacles.is_walkable({6, 2}));
    CHECK(obstacles.is_walkable({10, 3}));
    CHECK(obstacles.is_walkable({7, 4}));
    CHECK(obstacles.is_walkable({7, 1}));

    obstacles.unblock_footprint(clinic);
    CHECK(obstacles.blocked_count() == 0);
}

TEST_CASE("Footprint geometry", "[map]") {
    Footprint a{{2, 2}, 2, 2};
    CHECK(a.contains({2, 2}));
    CHECK(a.contains({3, 3}));
    CHECK_FALSE(a.contains({4, 2}));

    CHECK(a.overlaps(Footprint{{3, 3}, 2, 2}));
    CHECK_FALSE(a.overlaps(Footprint{{4, 2}, 1, 1}));
    CHECK_FALSE(a.overlaps(Footprint{{0, 0}, 2, 2}));

    int visited = 0;
    Footprint{{0, 0}, 3, 2}.for_each_cell([&](const GridCell&) { ++visited; });
    CHECK(visited == 6);
}
