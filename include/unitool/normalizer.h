#ifndef UNITOOL_NORMALIZER_H
#define UNITOOL_NORMALIZER_H

#include "unitool/diff.h"
#include "unitool/errors.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace norm {

enum class Form
{
    nfc,
    nfkc
};

// a line whose normalized form differs from the original
struct NormalizationIssue
{
    int line_number; // 1-based
    std::string original_line;
    std::string normalized_line;
    std::vector<CharDifference> differences;
};

// one character of an inspected string
struct CharInfo
{
    char32_t code_point;
    bool nfc;
    bool nfkc;
};

// All of these throw InvalidInputError when handed malformed UTF-8,
// and NormalizerError if ICU has no data for the requested form.

std::string normalize(std::string_view text, Form form = Form::nfkc);
bool is_normalized(std::string_view text, Form form = Form::nfkc);

// true if a and b have the same NFKC form
bool is_equivalent(std::string_view a, std::string_view b);

// uppercase hex of each code point, at least 4 digits each, no
// delimiter: "AB" -> "00410042"
std::string to_hex_code_points(std::string_view text);

// Checks one line of text.
//
// Returns an issue if the NFKC form of the line differs from the line,
// with the positional differences between the two; returns nothing if
// the line is already normalized.
//
// The differences stop at the shorter of the two forms, so a line whose
// normalization only appended characters yields an issue with no
// differences.
std::optional<NormalizationIssue> check_line(int line_number,
        std::string_view line);

// per-character code point and normalization status
std::vector<CharInfo> inspect(std::string_view text);

} // namespace norm

#endif // UNITOOL_NORMALIZER_H
