#ifndef UNITOOL_UNITOOL_H
#define UNITOOL_UNITOOL_H

#include "unitool/report.h"

struct Options
{
    // issues shown in detail by check
    int max_issues = report::default_max_issues;
    bool strip_bom = true;
};

#endif // UNITOOL_UNITOOL_H
