#include "unitool/normfile.h"

#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <ostream>
#include <string_view>
#include <system_error>
#include <utility>

using namespace std::literals;

namespace norm {

constexpr auto utf8_bom = "\xEF\xBB\xBF"sv;

// calls fn(line_number, line) for each line of in, with line
// terminators (and the BOM, if requested) removed
template <typename Fn>
static int for_each_line(std::istream& in, const FileOptions& options, Fn&& fn)
{
    int line_number = 0;
    std::string line;
    while (std::getline(in, line)) {
        line_number++;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        std::string_view v{line};
        if (line_number == 1 && options.strip_bom &&
                v.substr(0, utf8_bom.size()) == utf8_bom)
            v.remove_prefix(utf8_bom.size());

        fn(line_number, v);
    }

    return line_number;
}

// an input has to be an existing regular file. a directory opens
// fine as a stream but reads as empty.
static std::optional<FileError> check_input(const std::string& path)
{
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found)
        return FileError{FileError::not_found, path};
    if (ec || !std::filesystem::is_regular_file(status))
        return FileError{FileError::read_failed, path};

    return std::nullopt;
}

FileStats normalize_stream(std::istream& in, std::ostream& out,
        const FileOptions& options)
{
    FileStats stats;
    stats.lines_processed = for_each_line(in, options,
            [&](int line_number, std::string_view line) {
                try {
                    auto normalized = normalize(line);
                    if (normalized != line)
                        stats.lines_changed++;
                    out << normalized << '\n';
                } catch (const InvalidInputError&) {
                    stats.invalid_lines.push_back(line_number);
                    out << line << '\n';
                }
            });

    return stats;
}

FileResult normalize_file(const std::string& input_path,
        const std::string& output_path, const FileOptions& options)
{
    if (auto error = check_input(input_path))
        return *error;

    // truncating the output would empty the input first
    std::error_code ec;
    if (std::filesystem::equivalent(input_path, output_path, ec))
        return FileError{FileError::same_file, output_path};

    std::ifstream in(input_path, std::ios::binary);
    if (!in)
        return FileError{FileError::read_failed, input_path};

    // output_path is only replaced once everything was written
    auto temp_path = output_path + ".unitool-tmp";
    FileStats stats;
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out)
            return FileError{FileError::write_failed, output_path};

        stats = normalize_stream(in, out, options);
        out.flush();

        std::optional<FileError> error;
        if (in.bad())
            error = FileError{FileError::read_failed, input_path};
        else if (!out)
            error = FileError{FileError::write_failed, output_path};

        if (error) {
            out.close();
            std::filesystem::remove(temp_path, ec);
            return *error;
        }
    }

    std::filesystem::rename(temp_path, output_path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return FileError{FileError::write_failed, output_path};
    }

    return stats;
}

CheckReport check_stream(std::istream& in, const FileOptions& options)
{
    CheckReport report;
    report.lines_processed = for_each_line(in, options,
            [&](int line_number, std::string_view line) {
                try {
                    auto issue = check_line(line_number, line);
                    if (issue)
                        report.issues.push_back(std::move(*issue));
                } catch (const InvalidInputError&) {
                    report.invalid_lines.push_back(line_number);
                }
            });

    return report;
}

CheckResult check_file(const std::string& path, const FileOptions& options)
{
    if (auto error = check_input(path))
        return *error;

    std::ifstream in(path, std::ios::binary);
    if (!in)
        return FileError{FileError::read_failed, path};

    auto report = check_stream(in, options);
    if (in.bad())
        return FileError{FileError::read_failed, path};

    return report;
}

} // namespace norm
