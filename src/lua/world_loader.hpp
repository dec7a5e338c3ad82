#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sim/world.hpp" // WorldConfig

#include <string_view>

extern "C" {
struct lua_State;
}

namespace ij::lua {

class LuaState;

/// Reads the global `world` table produced by a world script into a
/// WorldConfig. Fields the script leaves out keep their defaults; a script
/// that lists `structures` replaces the default town entirely.
class WorldLoader {
public:
    /// Run a script file, then read `world`.
    Result<sim::WorldConfig> load_file(LuaState& state, const fs::path& path);

    /// Run a script held in memory, then read `world`.
    Result<sim::WorldConfig> load_string(LuaState& state, std::string_view code);

private:
    Result<sim::WorldConfig> read_world_table(lua_State* L);
    Result<void> read_structures(lua_State* L, sim::WorldConfig& config);
    Result<void> read_agent(lua_State* L, sim::WorldConfig& config);
};

} // namespace ij::lua
