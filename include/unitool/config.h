#ifndef UNITOOL_CONFIG_H
#define UNITOOL_CONFIG_H

// config script searched in the XDG config dirs
#define CONFIG_XDG_FILE "unitool/config.lua"
// fallback config script, run through wordexp
#define CONFIG_FILE "~/.unitool.lua"

#endif // UNITOOL_CONFIG_H
