#include "unitool/diff.h"
#include "unitool/errors.h"
#include "unitool/utf8.h"

#include <algorithm>

namespace norm {

std::vector<CharDifference> diff(std::u32string_view original,
        std::u32string_view normalized)
{
    std::vector<CharDifference> differences;

    auto len = std::min(original.size(), normalized.size());
    for (std::size_t i = 0; i < len; i++) {
        if (original[i] != normalized[i])
            differences.push_back({i, original[i], normalized[i]});
    }

    return differences;
}

std::vector<CharDifference> diff(std::string_view original,
        std::string_view normalized)
{
    check_utf8(original);
    check_utf8(normalized);

    return diff(utf8to32(original), utf8to32(normalized));
}

} // namespace norm
