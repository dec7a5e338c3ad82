#include "lua/world_loader.hpp"
#include "lua/lua_state.hpp"

#include <cmath>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace ij::lua {

namespace {

constexpr i64 MAX_GRID = sim::WorldConfig::MAX_GRID_SIZE;

/// Push t[name] where t is at the top of the stack.
void push_field(lua_State* L, const char* name) {
    lua_pushstring(L, name);
    lua_gettable(L, -2);
}

/// Read a numeric field of the table on top of the stack. Absent fields
/// yield nullopt; fields of the wrong type are an error.
Result<std::optional<f64>> number_field(lua_State* L, const char* name,
                                        const std::string& where) {
    push_field(L, name);
    std::optional<f64> out;
    if (lua_isnumber(L, -1)) {
        out = lua_tonumber(L, -1);
    } else if (!lua_isnil(L, -1)) {
        lua_pop(L, 1);
        return Error(ErrorKind::Config, where + "." + name + " must be a number");
    }
    lua_pop(L, 1);
    return out;
}

Result<std::optional<std::string>> string_field(lua_State* L, const char* name,
                                                const std::string& where) {
    push_field(L, name);
    std::optional<std::string> out;
    if (lua_type(L, -1) == LUA_TSTRING) {
        out = std::string(lua_tostring(L, -1));
    } else if (!lua_isnil(L, -1)) {
        lua_pop(L, 1);
        return Error(ErrorKind::Config, where + "." + name + " must be a string");
    }
    lua_pop(L, 1);
    return out;
}

/// Overwrite target with a numeric field if the script provides one.
template <typename T>
Result<void> apply_number(lua_State* L, const char* name,
                          const std::string& where, T& target) {
    auto v = number_field(L, name, where);
    if (!v) return v.error();
    if (v.value()) target = static_cast<T>(*v.value());
    return {};
}

/// Read an integral field in [lo, hi]. Fractions and out-of-range values
/// are rejected rather than truncated.
Result<std::optional<i64>> integer_field(lua_State* L, const char* name,
                                         const std::string& where, i64 lo,
                                         i64 hi) {
    auto v = number_field(L, name, where);
    if (!v) return v.error();
    if (!v.value()) return std::optional<i64>{};

    const f64 n = *v.value();
    if (std::floor(n) != n || n < static_cast<f64>(lo) ||
        n > static_cast<f64>(hi)) {
        return Error(ErrorKind::Config,
                     fmt::format("{}.{} must be an integer in [{}, {}], got {}",
                                 where, name, lo, hi, n));
    }
    return std::optional<i64>{static_cast<i64>(n)};
}

template <typename T>
Result<void> apply_integer(lua_State* L, const char* name,
                           const std::string& where, i64 lo, i64 hi, T& target) {
    auto v = integer_field(L, name, where, lo, hi);
    if (!v) return v.error();
    if (v.value()) target = static_cast<T>(*v.value());
    return {};
}

/// Push a sub-table; returns false (with nothing pushed) if absent.
Result<bool> enter_table(lua_State* L, const char* name,
                         const std::string& where) {
    push_field(L, name);
    if (lua_istable(L, -1)) return true;
    bool absent = lua_isnil(L, -1);
    lua_pop(L, 1);
    if (absent) return false;
    return Error(ErrorKind::Config, where + "." + name + " must be a table");
}

} // namespace

Result<sim::WorldConfig> WorldLoader::load_file(LuaState& state,
                                                const fs::path& path) {
    state.register_log_functions();
    spdlog::info("Executing world script: {}", path.string());
    auto result = state.do_file(path);
    if (!result) return result.error();
    return read_world_table(state.raw());
}

Result<sim::WorldConfig> WorldLoader::load_string(LuaState& state,
                                                  std::string_view code) {
    state.register_log_functions();
    auto result = state.do_string(code);
    if (!result) return result.error();
    return read_world_table(state.raw());
}

Result<sim::WorldConfig> WorldLoader::read_world_table(lua_State* L) {
    lua_getglobal(L, "world");
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error(ErrorKind::Config,
                     "'world' global is not a table after running the script");
    }

    sim::WorldConfig config = sim::WorldConfig::defaults();
    const std::string where = "world";

    // Each step leaves the world table on top of the stack.
    auto read_all = [&]() -> Result<void> {
        auto grid = enter_table(L, "grid", where);
        if (!grid) return grid.error();
        if (grid.value()) {
            auto w = apply_integer(L, "width", "world.grid", 1, MAX_GRID,
                                   config.grid_width);
            auto h = w ? apply_integer(L, "height", "world.grid", 1, MAX_GRID,
                                       config.grid_height)
                       : w;
            lua_pop(L, 1);
            if (!h) return h.error();
        }

        auto tile = enter_table(L, "tile", where);
        if (!tile) return tile.error();
        if (tile.value()) {
            auto& p = config.projection;
            auto w = apply_number(L, "width", "world.tile", p.tile_width);
            auto h = w ? apply_number(L, "height", "world.tile", p.tile_height) : w;
            lua_pop(L, 1);
            if (!h) return h.error();
        }

        auto offset = enter_table(L, "offset", where);
        if (!offset) return offset.error();
        if (offset.value()) {
            auto& p = config.projection;
            auto x = apply_number(L, "x", "world.offset", p.x_offset);
            auto y = x ? apply_number(L, "y", "world.offset", p.y_offset) : x;
            lua_pop(L, 1);
            if (!y) return y.error();
        }

        auto speed = apply_number(L, "move_speed", where, config.move_speed);
        if (!speed) return speed;

        auto structures = read_structures(L, config);
        if (!structures) return structures;
        return read_agent(L, config);
    };

    auto result = read_all();
    lua_pop(L, 1); // pop world table
    if (!result) return result.error();

    if (config.projection.tile_width <= 0 || config.projection.tile_height <= 0) {
        return Error(ErrorKind::Config, "world.tile dimensions must be positive");
    }

    spdlog::info("World script: {}x{} grid, tile {}x{}, {} structures",
                 config.grid_width, config.grid_height,
                 config.projection.tile_width, config.projection.tile_height,
                 config.structures.size());
    return config;
}

Result<void> WorldLoader::read_structures(lua_State* L,
                                          sim::WorldConfig& config) {
    auto list = enter_table(L, "structures", "world");
    if (!list) return list.error();
    if (!list.value()) return {}; // keep the default town

    config.structures.clear();
    Result<void> status;

    // Iterate the array: structures[1], structures[2], ...
    for (int i = 1;; i++) {
        lua_rawgeti(L, -1, i);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }

        const std::string where = "world.structures[" + std::to_string(i) + "]";
        if (!lua_istable(L, -1)) {
            lua_pop(L, 1);
            status = Error(ErrorKind::Config, where + " must be a table");
            break;
        }

        sim::StructureSpec spec;
        auto read_one = [&]() -> Result<void> {
            auto key = string_field(L, "key", where);
            if (!key) return key.error();
            if (!key.value()) {
                return Error(ErrorKind::Config, where + ".key is required");
            }
            spec.key = *key.value();

            auto name = string_field(L, "name", where);
            if (!name) return name.error();
            spec.name = name.value().value_or(spec.key);

            auto kind = string_field(L, "kind", where);
            if (!kind) return kind.error();
            if (kind.value()) {
                auto parsed = sim::structure_kind_from_string(*kind.value());
                if (!parsed) {
                    return Error(ErrorKind::Config,
                                 where + ".kind '" + *kind.value() + "' is unknown");
                }
                spec.kind = *parsed;
            }

            auto x = integer_field(L, "x", where, 0, MAX_GRID - 1);
            if (!x) return x.error();
            auto y = integer_field(L, "y", where, 0, MAX_GRID - 1);
            if (!y) return y.error();
            if (!x.value() || !y.value()) {
                return Error(ErrorKind::Config, where + " needs x and y");
            }
            spec.origin = {static_cast<i32>(*x.value()),
                           static_cast<i32>(*y.value())};

            auto w = apply_integer(L, "width", where, 1, MAX_GRID, spec.width);
            if (!w) return w;
            auto h = apply_integer(L, "height", where, 1, MAX_GRID, spec.height);
            if (!h) return h;

            auto entry = enter_table(L, "entry", where);
            if (!entry) return entry.error();
            if (entry.value()) {
                GridCell offset;
                auto ex = apply_integer(L, "x", where + ".entry", -MAX_GRID,
                                        MAX_GRID, offset.x);
                auto ey = ex ? apply_integer(L, "y", where + ".entry", -MAX_GRID,
                                             MAX_GRID, offset.y)
                             : ex;
                lua_pop(L, 1);
                if (!ey) return ey;
                spec.entry_offset = offset;
            }
            return {};
        };

        auto one = read_one();
        lua_pop(L, 1); // pop structures[i]
        if (!one) {
            status = one;
            break;
        }
        config.structures.push_back(std::move(spec));
    }

    lua_pop(L, 1); // pop structures table
    return status;
}

Result<void> WorldLoader::read_agent(lua_State* L, sim::WorldConfig& config) {
    auto agent = enter_table(L, "agent", "world");
    if (!agent) return agent.error();
    if (!agent.value()) return {};

    sim::AgentSpec spec;
    auto read_one = [&]() -> Result<void> {
        auto name = string_field(L, "name", "world.agent");
        if (!name) return name.error();
        if (name.value()) spec.name = *name.value();

        auto x = apply_integer(L, "x", "world.agent", 0, MAX_GRID - 1,
                               spec.start.x);
        if (!x) return x;
        return apply_integer(L, "y", "world.agent", 0, MAX_GRID - 1,
                             spec.start.y);
    };

    auto result = read_one();
    lua_pop(L, 1); // pop agent table
    if (!result) return result;

    config.agents.clear();
    config.agents.push_back(std::move(spec));
    return {};
}

} // namespace ij::lua
