#include "lua/logging.h"
#include "lua/state.h"
#include "unitool/logging.h"

#include <cstring>
#include <iterator>
#include <memory>
#include <string>

/// Logging module; config scripts use it to write to, and tune, the
// loggers the tool itself writes to.
// @module logging

/// A named logger, shared with the C++ side.
// @type Logger

#define LOGGER_TNAME "unitool.Logger"

using LoggerPtr = std::shared_ptr<logging::Logger>;

static logging::Logger& checklogger(lua::State& L)
{
    return **L.checkobj<LoggerPtr>(1, LOGGER_TNAME);
}

static bool valid_level(lua_Integer level)
{
    return logging::trace <= level && level <= logging::off;
}

// joins tostring() of every argument from first up, tab separated,
// and writes it to logger if level is enabled
static void write_entry(lua::State& L, logging::Logger& logger,
        logging::level_enum level, int first)
{
    if (level < logger.level())
        return;

    std::string text;
    int last = L.gettop();
    L.getglobal("tostring");
    for (int i = first; i <= last; i++) {
        L.pushvalue(-1);
        L.pushvalue(i);
        L.call(1, 1);

        std::size_t len = 0;
        const char* s = L.tostring(-1, &len);
        if (!s) {
            luaL_error(L.state(), "'tostring' must return a string to log");
            return;
        }

        if (i > first)
            text += '\t';
        text.append(s, len);
        L.pop();
    }
    L.pop();

    logger.log(level, text);
}

/// Writes an entry at the given level.
// @function log
// @int level One of the level fields
// @param ... Values to write, each passed through `tostring`
static int logger_log(lua_State* l)
{
    lua::State L(l);
    auto& logger = checklogger(L);

    lua_Integer level = L.checkinteger(2);
    luaL_argcheck(l, valid_level(level), 2, "invalid log level");

    write_entry(L, logger, static_cast<logging::level_enum>(level), 3);
    return 0;
}

/// Writes an entry at the level the method is named after.
// @function trace
// @function debug
// @function info
// @function warn
// @function err
// @param ... Values to write, each passed through `tostring`
static int logger_at_level(lua_State* l)
{
    lua::State L(l);
    auto& logger = checklogger(L);

    auto level = static_cast<logging::level_enum>(
            lua_tointeger(l, lua_upvalueindex(1)));
    write_entry(L, logger, level, 2);
    return 0;
}

/// Current level; entries below it are dropped.
//
// Read and assigned through `__index` / `__newindex`.
//
// @class field
// @name level

static int logger_index(lua_State* l)
{
    lua::State L(l);
    auto& logger = checklogger(L);
    const char* key = L.checkstring(2);

    if (std::strcmp(key, "level") == 0)
        L.pushinteger(logger.level());
    else if (luaL_getmetafield(l, 1, key) == LUA_TNIL)
        L.pushnil();

    return 1;
}

static int logger_newindex(lua_State* l)
{
    lua::State L(l);
    auto& logger = checklogger(L);
    const char* key = L.checkstring(2);

    if (std::strcmp(key, "level") != 0)
        return luaL_error(l, "cannot set logger field '%s'", key);

    lua_Integer level = L.checkinteger(3);
    luaL_argcheck(l, valid_level(level), 3, "invalid log level");
    logger.level(static_cast<logging::level_enum>(level));
    return 0;
}

static int logger_gc(lua_State* l)
{
    lua::State(l).delobj<LoggerPtr>(1, LOGGER_TNAME);
    return 0;
}

// level methods are added as closures in logging_openf
static const luaL_Reg logger_methods[] = {
        {"log", logger_log},
        {"__index", logger_index},
        {"__newindex", logger_newindex},
        {"__gc", logger_gc},
        {nullptr, nullptr}};

/// Functions
// @section functions

/// Returns the logger called name, creating it if needed.
//
// @function logging.get
// @string name Logger name
// @usage local log = logging.get("config")
static int logging_get(lua_State* l)
{
    lua::State L(l);
    const char* name = L.checkstring(1);

    auto logger = logging::get(name);
    *L.newobj<LoggerPtr>(LOGGER_TNAME) = std::move(logger);
    return 1;
}

/// Sets the level of every logger, current and future.
//
// @function logging.set_level
// @int level One of the level fields
static int logging_set_level(lua_State* l)
{
    lua::State L(l);
    lua_Integer level = L.checkinteger(1);
    luaL_argcheck(l, valid_level(level), 1, "invalid log level");

    logging::default_level(static_cast<logging::level_enum>(level));
    return 0;
}

static const luaL_Reg logging_funcs[] = {
        {"get", logging_get},
        {"set_level", logging_set_level},
        {nullptr, nullptr}};

struct LevelField
{
    const char* name;
    logging::level_enum level;
    // loggers get a method of the same name
    bool method;
};

/// Fields
// @section fields
// trace, debug, info, warn, err, fatal, off
static const LevelField level_fields[] = {
        {"trace", logging::trace, true},
        {"debug", logging::debug, true},
        {"info", logging::info, true},
        {"warn", logging::warn, true},
        {"err", logging::err, true},
        {"fatal", logging::fatal, false},
        {"off", logging::off, false}};

static int logging_openf(lua_State* l)
{
    lua::State L(l);

    L.newlib(logging_funcs, static_cast<int>(std::size(level_fields)));
    for (auto& field : level_fields) {
        L.pushinteger(field.level);
        L.setfield(-2, field.name);
    }

    L.setobjfuncs(LOGGER_TNAME, logger_methods);
    luaL_getmetatable(l, LOGGER_TNAME);
    for (auto& field : level_fields) {
        if (!field.method)
            continue;
        L.pushinteger(field.level);
        lua_pushcclosure(l, logger_at_level, 1);
        L.setfield(-2, field.name);
    }
    L.pop();

    return 1;
}

void lua::register_lualogging(lua::State* L)
{
    L->requiref("logging", logging_openf, true);
}
