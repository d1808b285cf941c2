#ifndef UNITOOL_VERSION_H
#define UNITOOL_VERSION_H

#include <string_view>

std::string_view version_string();

#endif // UNITOOL_VERSION_H
