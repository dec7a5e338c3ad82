#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

extern "C" {
#include <lua.h>
}

namespace ij::log {

void init(const std::filesystem::path& log_file) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        log_file.string(), true);

    auto logger = std::make_shared<spdlog::logger>(
        "isojourney", spdlog::sinks_init_list{console_sink, file_sink});
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
    // Rejections and script errors reach the file even if the run aborts.
    spdlog::flush_on(spdlog::level::warn);
    spdlog::info("IsoJourney v0.1.0");
}

void shutdown() {
    spdlog::shutdown();
}

/// Join the arguments of a LOG-style call. Tables and functions print as
/// their type name.
static std::string join_script_args(lua_State* L) {
    std::string out;
    const int argc = lua_gettop(L);
    for (int i = 1; i <= argc; i++) {
        switch (lua_type(L, i)) {
        case LUA_TSTRING:
        case LUA_TNUMBER:
            out += lua_tostring(L, i);
            break;
        case LUA_TBOOLEAN:
            out += lua_toboolean(L, i) ? "true" : "false";
            break;
        default:
            out += lua_typename(L, lua_type(L, i));
            break;
        }
    }
    return out;
}

static int log_from_script(lua_State* L, spdlog::level::level_enum level) {
    spdlog::log(level, "[script] {}", join_script_args(L));
    return 0;
}

int l_LOG(lua_State* L) { return log_from_script(L, spdlog::level::info); }
int l_WARN(lua_State* L) { return log_from_script(L, spdlog::level::warn); }
int l_SPEW(lua_State* L) { return log_from_script(L, spdlog::level::debug); }
int l_ALERT(lua_State* L) { return log_from_script(L, spdlog::level::err); }

} // namespace ij::log
