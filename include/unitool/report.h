#ifndef UNITOOL_REPORT_H
#define UNITOOL_REPORT_H

#include "unitool/normfile.h"

#include "fmt/format.h"

#include <string_view>
#include <vector>

// console rendering for the unitool commands; everything is
// formatted into a buffer so callers decide where it goes

namespace report {

constexpr int default_max_issues = 10;

void format_difference(fmt::memory_buffer& buf,
        const norm::CharDifference& difference);
void format_issue(fmt::memory_buffer& buf,
        const norm::NormalizationIssue& issue);

// shows at most max_issues issues in detail, then a count of the rest
void format_issues(fmt::memory_buffer& buf,
        const std::vector<norm::NormalizationIssue>& issues,
        int max_issues = default_max_issues);

void format_file_error(fmt::memory_buffer& buf, const norm::FileError& error);

void format_check(fmt::memory_buffer& buf, std::string_view path,
        const norm::CheckResult& result,
        int max_issues = default_max_issues);
void format_normalize(fmt::memory_buffer& buf, std::string_view input_path,
        std::string_view output_path, const norm::FileResult& result);

// character by character inspection of two strings and whether they
// are equivalent under NFKC. throws norm::InvalidInputError if either
// string is malformed.
void format_compare(fmt::memory_buffer& buf, std::string_view string1,
        std::string_view string2);

} // namespace report

#endif // UNITOOL_REPORT_H
