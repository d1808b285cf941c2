#ifndef UNITOOL_DIFF_H
#define UNITOOL_DIFF_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace norm {

// one position where a string and its normalized form disagree
struct CharDifference
{
    std::size_t position; // code point index into the original
    char32_t original;
    char32_t normalized;
};

inline bool operator==(const CharDifference& lhs, const CharDifference& rhs)
{
    return lhs.position == rhs.position &&
           lhs.original == rhs.original &&
           lhs.normalized == rhs.normalized;
}

inline bool operator!=(const CharDifference& lhs, const CharDifference& rhs)
{
    return !(lhs == rhs);
}

// Positional diff of two code point sequences.
//
// Compares index by index up to the length of the shorter sequence and
// reports each index where the two disagree, in ascending order. No
// realignment is attempted: an insertion or removal shows up as a run of
// mismatches from that point on, and anything past the end of the shorter
// sequence is not reported at all.
std::vector<CharDifference> diff(std::u32string_view original,
        std::u32string_view normalized);

// same, for UTF-8 text. throws InvalidInputError if either argument
// is malformed.
std::vector<CharDifference> diff(std::string_view original,
        std::string_view normalized);

} // namespace norm

#endif // UNITOOL_DIFF_H
