#ifndef LUA_STATE_H
#define LUA_STATE_H

#include <cstddef>
#include <lua.hpp>
#include <new>

namespace lua {

// wraps a lua_State. a default constructed State owns a new state and
// closes it on destruction; one built from a lua_State* (inside a C
// function) only borrows it.
class State
{
public:
    State();
    explicit State(lua_State* l);
    ~State();

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    lua_State* state() const { return m_state; }

    void openlibs();
    // both return a lua status code, leaving the error message on
    // the stack when it isn't LUA_OK
    int loadfile(const char* path);
    int pcall(int nargs, int nresults);
    void call(int nargs, int nresults);

    int gettop() const;
    void pop(int n = 1);
    void pushvalue(int index);
    void pushnil();
    void pushinteger(lua_Integer n);
    void newtable();

    int getglobal(const char* name);
    void setglobal(const char* name);
    int getfield(int index, const char* key);
    void setfield(int index, const char* key);
    bool istable(int index) const;

    const char* tostring(int index, std::size_t* len = nullptr);
    const char* checkstring(int arg);
    lua_Integer checkinteger(int arg);

    // the value at index, or def if it isn't an integer
    lua_Integer optinteger(int index, lua_Integer def);
    // the value at index, or def if it is nil
    bool optbool(int index, bool def);

    // pushes a table holding funcs, with room for nfields more entries
    void newlib(const luaL_Reg* funcs, int nfields = 0);
    void requiref(const char* modname, lua_CFunction openf, bool global);

    // registers metatable tname with methods, used by newobj
    void setobjfuncs(const char* tname, const luaL_Reg* methods);

    template <typename T>
    T* newobj(const char* tname)
    {
        void* mem = lua_newuserdata(m_state, sizeof(T));
        T* obj = new (mem) T();
        luaL_setmetatable(m_state, tname);
        return obj;
    }

    template <typename T>
    T* checkobj(int arg, const char* tname)
    {
        return static_cast<T*>(luaL_checkudata(m_state, arg, tname));
    }

    template <typename T>
    void delobj(int arg, const char* tname)
    {
        checkobj<T>(arg, tname)->~T();
    }

private:
    lua_State* m_state;
    bool m_owns;
};

} // namespace lua

#endif // LUA_STATE_H
