#include "lua/config.h"
#include "lua/state.h"

#include <algorithm>
#include <limits>

namespace lua {
namespace config {

// pushes config[name], or nil if config isn't a table.
// always leaves two values on the stack.
static void push_field(State* L, const char* name)
{
    L->getglobal("config");
    if (L->istable(-1))
        L->getfield(-1, name);
    else
        L->pushnil();
}

int get_int(State* L, const char* name, int def)
{
    push_field(L, name);
    lua_Integer val = L->optinteger(-1, def);
    L->pop(2);

    // lua integers are wider than int
    return static_cast<int>(std::clamp<lua_Integer>(val,
            std::numeric_limits<int>::min(),
            std::numeric_limits<int>::max()));
}

bool get_bool(State* L, const char* name, bool def)
{
    push_field(L, name);
    bool val = L->optbool(-1, def);
    L->pop(2);

    return val;
}

void ensure_table(State* L)
{
    L->getglobal("config");
    bool exists = L->istable(-1);
    L->pop();

    if (!exists) {
        L->newtable();
        L->setglobal("config");
    }
}

bool run_file(State* L, const char* path, std::string* err)
{
    if (L->loadfile(path) != LUA_OK || L->pcall(0, 0) != LUA_OK) {
        if (err) {
            const char* msg = L->tostring(-1);
            *err = msg ? msg : "unknown error";
        }
        L->pop(1);
        return false;
    }

    return true;
}

} // namespace config
} // namespace lua
