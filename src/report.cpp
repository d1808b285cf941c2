#include "unitool/report.h"
#include "unitool/utf8.h"

#include <cstdint>
#include <iterator>
#include <variant>

using namespace std::literals;

namespace report {

constexpr auto check_mark = "✓"sv;
constexpr auto cross_mark = "✗"sv;
constexpr auto warn_mark = "⚠"sv;
constexpr auto arrow = "→"sv;

static std::string_view mark(bool ok)
{
    return ok ? check_mark : cross_mark;
}

void format_difference(fmt::memory_buffer& buf,
        const norm::CharDifference& difference)
{
    fmt::format_to(std::back_inserter(buf),
            "  Column: {:3} '{}' (U+{:04X}) {} '{}' (U+{:04X})\n",
            difference.position,
            utf8encode(difference.original),
            static_cast<uint32_t>(difference.original),
            arrow,
            utf8encode(difference.normalized),
            static_cast<uint32_t>(difference.normalized));
}

void format_issue(fmt::memory_buffer& buf,
        const norm::NormalizationIssue& issue)
{
    auto out = std::back_inserter(buf);
    fmt::format_to(out, "Line {:4}:\n", issue.line_number);

    for (auto& difference : issue.differences)
        format_difference(buf, difference);

    // normalization only added or removed characters at the end
    if (issue.differences.empty())
        fmt::format_to(out, "  Length changed: {} {} {} characters\n",
                utf8length(issue.original_line), arrow,
                utf8length(issue.normalized_line));

    fmt::format_to(out, "\n");
}

void format_issues(fmt::memory_buffer& buf,
        const std::vector<norm::NormalizationIssue>& issues, int max_issues)
{
    auto out = std::back_inserter(buf);

    if (issues.empty()) {
        fmt::format_to(out, "{} All text is properly normalized (Form KC)\n",
                check_mark);
        return;
    }

    fmt::format_to(out, "{} Found {} line(s) with normalization issues:\n\n",
            warn_mark, issues.size());

    std::size_t shown = max_issues < 0 ? 0 : static_cast<std::size_t>(max_issues);
    if (shown > issues.size())
        shown = issues.size();

    for (std::size_t i = 0; i < shown; i++)
        format_issue(buf, issues[i]);

    if (issues.size() > shown)
        fmt::format_to(out, "... and {} more issue(s)\n",
                issues.size() - shown);
}

void format_file_error(fmt::memory_buffer& buf, const norm::FileError& error)
{
    auto out = std::back_inserter(buf);
    switch (error.kind) {
        case norm::FileError::not_found:
            fmt::format_to(out, "Error: File not found: {}\n", error.path);
            break;
        case norm::FileError::read_failed:
            fmt::format_to(out, "Error: Unable to read file: {}\n", error.path);
            break;
        case norm::FileError::write_failed:
            fmt::format_to(out, "Error: Unable to write file: {}\n", error.path);
            break;
        case norm::FileError::same_file:
            fmt::format_to(out,
                    "Error: Output would overwrite the input file: {}\n",
                    error.path);
            break;
    }
}

void format_check(fmt::memory_buffer& buf, std::string_view path,
        const norm::CheckResult& result, int max_issues)
{
    if (auto error = std::get_if<norm::FileError>(&result)) {
        format_file_error(buf, *error);
        return;
    }

    auto& checked = std::get<norm::CheckReport>(result);
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "Checking file: {}\n\n", path);

    for (int line_number : checked.invalid_lines)
        fmt::format_to(out, "{} Line {}: not valid UTF-8\n",
                cross_mark, line_number);
    if (!checked.invalid_lines.empty())
        fmt::format_to(out, "\n");

    format_issues(buf, checked.issues, max_issues);
}

void format_normalize(fmt::memory_buffer& buf, std::string_view input_path,
        std::string_view output_path, const norm::FileResult& result)
{
    auto out = std::back_inserter(buf);
    fmt::format_to(out, "Normalizing: {} {} {}\n",
            input_path, arrow, output_path);

    if (auto error = std::get_if<norm::FileError>(&result)) {
        format_file_error(buf, *error);
        return;
    }

    auto& stats = std::get<norm::FileStats>(result);
    for (int line_number : stats.invalid_lines)
        fmt::format_to(out, "{} Line {}: not valid UTF-8, copied unchanged\n",
                cross_mark, line_number);

    fmt::format_to(out, "{} Complete: {} lines processed, {} lines normalized\n",
            check_mark, stats.lines_processed, stats.lines_changed);
}

static void format_unicode_information(fmt::memory_buffer& buf,
        std::string_view text)
{
    auto out = std::back_inserter(buf);

    for (auto& info : norm::inspect(text)) {
        auto cp = static_cast<uint32_t>(info.code_point);
        fmt::format_to(out, "  Character: '{}' {} U+{:04X} (decimal: {})\n",
                utf8encode(info.code_point), arrow, cp, cp);
        fmt::format_to(out,
                "    Normalized Form C: {} | Normalized Form KC: {}\n",
                mark(info.nfc), mark(info.nfkc));
    }
}

void format_compare(fmt::memory_buffer& buf, std::string_view string1,
        std::string_view string2)
{
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "String Comparison:\n");
    fmt::format_to(out, "==================\n\n");

    fmt::format_to(out, "String 1: '{}'\n", string1);
    format_unicode_information(buf, string1);
    fmt::format_to(out, "\n");

    fmt::format_to(out, "String 2: '{}'\n", string2);
    format_unicode_information(buf, string2);
    fmt::format_to(out, "\n");

    auto normalized1 = norm::normalize(string1);
    auto normalized2 = norm::normalize(string2);

    fmt::format_to(out, "After Form KC Normalization:\n");
    fmt::format_to(out, "  String 1: '{}' (U+{})\n",
            normalized1, norm::to_hex_code_points(normalized1));
    fmt::format_to(out, "  String 2: '{}' (U+{})\n\n",
            normalized2, norm::to_hex_code_points(normalized2));

    if (normalized1 == normalized2)
        fmt::format_to(out, "{} Strings are equivalent after normalization\n",
                check_mark);
    else
        fmt::format_to(out, "{} Strings are different even after normalization\n",
                cross_mark);
}

} // namespace report
