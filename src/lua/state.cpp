#include "lua/state.h"

namespace lua {

State::State() :
    m_state(luaL_newstate()),
    m_owns(true)
{
    if (!m_state)
        throw std::bad_alloc();
}

State::State(lua_State* l) :
    m_state(l),
    m_owns(false)
{ }

State::~State()
{
    if (m_owns)
        lua_close(m_state);
}

void State::openlibs() { luaL_openlibs(m_state); }

int State::loadfile(const char* path) { return luaL_loadfile(m_state, path); }

int State::pcall(int nargs, int nresults)
{
    return lua_pcall(m_state, nargs, nresults, 0);
}

void State::call(int nargs, int nresults) { lua_call(m_state, nargs, nresults); }

int State::gettop() const { return lua_gettop(m_state); }

void State::pop(int n) { lua_pop(m_state, n); }

void State::pushvalue(int index) { lua_pushvalue(m_state, index); }

void State::pushnil() { lua_pushnil(m_state); }

void State::pushinteger(lua_Integer n) { lua_pushinteger(m_state, n); }

void State::newtable() { lua_newtable(m_state); }

int State::getglobal(const char* name) { return lua_getglobal(m_state, name); }

void State::setglobal(const char* name) { lua_setglobal(m_state, name); }

int State::getfield(int index, const char* key)
{
    return lua_getfield(m_state, index, key);
}

void State::setfield(int index, const char* key)
{
    lua_setfield(m_state, index, key);
}

bool State::istable(int index) const { return lua_istable(m_state, index); }

const char* State::tostring(int index, std::size_t* len)
{
    return lua_tolstring(m_state, index, len);
}

const char* State::checkstring(int arg) { return luaL_checkstring(m_state, arg); }

lua_Integer State::checkinteger(int arg)
{
    return luaL_checkinteger(m_state, arg);
}

lua_Integer State::optinteger(int index, lua_Integer def)
{
    int isnum = 0;
    lua_Integer val = lua_tointegerx(m_state, index, &isnum);
    return isnum ? val : def;
}

bool State::optbool(int index, bool def)
{
    if (lua_isnil(m_state, index))
        return def;
    return lua_toboolean(m_state, index) != 0;
}

void State::newlib(const luaL_Reg* funcs, int nfields)
{
    int nfuncs = 0;
    for (auto f = funcs; f->name; f++)
        nfuncs++;

    lua_createtable(m_state, 0, nfuncs + nfields);
    luaL_setfuncs(m_state, funcs, 0);
}

void State::requiref(const char* modname, lua_CFunction openf, bool global)
{
    luaL_requiref(m_state, modname, openf, global ? 1 : 0);
    // drop the copy of the module left on the stack
    pop();
}

void State::setobjfuncs(const char* tname, const luaL_Reg* methods)
{
    luaL_newmetatable(m_state, tname);
    // methods are looked up on the metatable itself, unless methods
    // brings its own __index
    pushvalue(-1);
    setfield(-2, "__index");
    luaL_setfuncs(m_state, methods, 0);
    pop();
}

} // namespace lua
