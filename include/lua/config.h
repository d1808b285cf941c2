#ifndef LUA_CONFIG_H
#define LUA_CONFIG_H

#include <string>

namespace lua {

class State;

namespace config {

// helper functions for the global lua config table.
// a missing table or field yields the default. integers outside
// the range of int are clamped to it.

int get_int(State* L, const char* name, int def);
bool get_bool(State* L, const char* name, bool def);

// creates an empty global config table, if there isn't one
void ensure_table(State* L);

// loads and runs a config script. on failure, returns false and
// stores the lua error in err.
bool run_file(State* L, const char* path, std::string* err);

} // namespace config
} // namespace lua

#endif // LUA_CONFIG_H
