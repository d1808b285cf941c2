#include "unitool/version.h"

#ifndef UNITOOL_VERSION
#define UNITOOL_VERSION "unknown"
#endif

std::string_view version_string()
{
    return UNITOOL_VERSION;
}
