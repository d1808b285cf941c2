#ifndef UNITOOL_NORMFILE_H
#define UNITOOL_NORMFILE_H

#include "unitool/normalizer.h"

#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace norm {

struct FileOptions
{
    // drop a UTF-8 byte order mark at the start of the first line
    bool strip_bom = true;
};

struct FileError
{
    enum Kind
    {
        not_found,
        read_failed,
        write_failed,
        // input and output name the same file
        same_file
    };

    Kind kind;
    std::string path;
};

struct FileStats
{
    int lines_changed = 0;
    int lines_processed = 0;
    // lines that were not valid UTF-8 and were copied unchanged
    std::vector<int> invalid_lines;
};

struct CheckReport
{
    std::vector<NormalizationIssue> issues;
    // lines that were not valid UTF-8 and could not be checked
    std::vector<int> invalid_lines;
    int lines_processed = 0;
};

using FileResult = std::variant<FileStats, FileError>;
using CheckResult = std::variant<CheckReport, FileError>;

// Writes the NFKC form of each line of in to out, one '\n' terminated
// line per input line, in order.
FileStats normalize_stream(std::istream& in, std::ostream& out,
        const FileOptions& options = {});

// Normalizes input_path into output_path. The output is written to a
// temporary file beside it and renamed into place on success, so on
// any error output_path is left as it was. An input that is not a
// regular file is a read_failed error.
FileResult normalize_file(const std::string& input_path,
        const std::string& output_path, const FileOptions& options = {});

CheckReport check_stream(std::istream& in, const FileOptions& options = {});
CheckResult check_file(const std::string& path,
        const FileOptions& options = {});

} // namespace norm

#endif // UNITOOL_NORMFILE_H
