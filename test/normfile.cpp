#include "doctest.h"
#include "unitool/normfile.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>
#include <variant>

namespace fs = std::filesystem;

// creates a scratch directory for the duration of a test
class TempDirFixture
{
public:
    TempDirFixture()
    {
        static int counter = 0;
        dir = fs::temp_directory_path() /
              ("unitool-test-" + std::to_string(::getpid()) + "-" +
                      std::to_string(counter++));
        fs::create_directories(dir);
    }

    ~TempDirFixture()
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

protected:
    std::string write(const std::string& name, const std::string& contents)
    {
        auto path = (dir / name).string();
        std::ofstream out(path, std::ios::binary);
        out << contents;
        return path;
    }

    std::string read(const std::string& path)
    {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in),
                std::istreambuf_iterator<char>()};
    }

    fs::path dir;
};

TEST_SUITE_BEGIN("normfile");

TEST_CASE("streams are normalized line by line")
{
    std::ostringstream out;

    SUBCASE("one line in three changes")
    {
        std::istringstream in{"first\ncafe\u0301\nthird\n"};
        auto stats = norm::normalize_stream(in, out);

        CHECK(stats.lines_processed == 3);
        CHECK(stats.lines_changed == 1);
        CHECK(stats.invalid_lines.empty());
        CHECK(out.str() == "first\ncaf\u00E9\nthird\n");
    }

    SUBCASE("empty lines are kept")
    {
        std::istringstream in{"\n\n\uFF21\n\n"};
        auto stats = norm::normalize_stream(in, out);

        CHECK(stats.lines_processed == 4);
        CHECK(stats.lines_changed == 1);
        CHECK(out.str() == "\n\nA\n\n");
    }

    SUBCASE("final line without terminator")
    {
        std::istringstream in{"a\n\u2460"};
        auto stats = norm::normalize_stream(in, out);

        CHECK(stats.lines_processed == 2);
        CHECK(stats.lines_changed == 1);
        CHECK(out.str() == "a\n1\n");
    }

    SUBCASE("empty input")
    {
        std::istringstream in{""};
        auto stats = norm::normalize_stream(in, out);

        CHECK(stats.lines_processed == 0);
        CHECK(stats.lines_changed == 0);
        CHECK(out.str().empty());
    }

    SUBCASE("crlf line endings")
    {
        std::istringstream in{"one\r\n\uFB01\r\n"};
        auto stats = norm::normalize_stream(in, out);

        CHECK(stats.lines_processed == 2);
        CHECK(stats.lines_changed == 1);
        CHECK(out.str() == "one\nfi\n");
    }

    SUBCASE("byte order mark")
    {
        std::istringstream in{"\xEF\xBB\xBFhello\n"};

        SUBCASE("is stripped by default")
        {
            auto stats = norm::normalize_stream(in, out);
            CHECK(stats.lines_changed == 0);
            CHECK(out.str() == "hello\n");
        }

        SUBCASE("can be kept")
        {
            norm::FileOptions options;
            options.strip_bom = false;
            auto stats = norm::normalize_stream(in, out, options);
            CHECK(stats.lines_changed == 0);
            CHECK(out.str() == "\xEF\xBB\xBFhello\n");
        }
    }

    SUBCASE("malformed lines are copied and reported")
    {
        std::istringstream in{"ok\nbad\xFF\n\u2460\n"};
        auto stats = norm::normalize_stream(in, out);

        CHECK(stats.lines_processed == 3);
        CHECK(stats.lines_changed == 1);
        REQUIRE(stats.invalid_lines.size() == 1);
        CHECK(stats.invalid_lines[0] == 2);
        CHECK(out.str() == "ok\nbad\xFF\n1\n");
    }
}

TEST_CASE("streams are checked line by line")
{
    std::istringstream in{"plain\ncafe\u0301\nbad\xC3\n\uFF21\uFF22\nplain again\n"};
    auto report = norm::check_stream(in);

    CHECK(report.lines_processed == 5);
    REQUIRE(report.issues.size() == 2);
    CHECK(report.issues[0].line_number == 2);
    CHECK(report.issues[0].differences.size() == 1);
    CHECK(report.issues[1].line_number == 4);
    CHECK(report.issues[1].normalized_line == "AB");
    REQUIRE(report.invalid_lines.size() == 1);
    CHECK(report.invalid_lines[0] == 3);
}

TEST_CASE_FIXTURE(TempDirFixture, "files are normalized")
{
    auto input = write("input.txt", "line one\nfull\uFF37idth\nline three\n");
    auto output = (dir / "output.txt").string();

    auto result = norm::normalize_file(input, output);

    REQUIRE(std::holds_alternative<norm::FileStats>(result));
    auto& stats = std::get<norm::FileStats>(result);
    CHECK(stats.lines_changed == 1);
    CHECK(stats.lines_processed == 3);
    CHECK(read(output) == "line one\nfullWidth\nline three\n");
}

TEST_CASE_FIXTURE(TempDirFixture, "missing input is reported without creating output")
{
    auto input = (dir / "does-not-exist.txt").string();
    auto output = (dir / "output.txt").string();

    auto result = norm::normalize_file(input, output);

    REQUIRE(std::holds_alternative<norm::FileError>(result));
    auto& error = std::get<norm::FileError>(result);
    CHECK(error.kind == norm::FileError::not_found);
    CHECK(error.path == input);
    CHECK_FALSE(fs::exists(output));
}

TEST_CASE_FIXTURE(TempDirFixture, "unwritable output is reported")
{
    auto input = write("input.txt", "text\n");
    auto output = (dir / "missing-dir" / "output.txt").string();

    auto result = norm::normalize_file(input, output);

    REQUIRE(std::holds_alternative<norm::FileError>(result));
    CHECK(std::get<norm::FileError>(result).kind == norm::FileError::write_failed);
}

TEST_CASE_FIXTURE(TempDirFixture, "input is never used as its own output")
{
    auto contents = "one\ncafe\u0301\nthree\n";
    auto input = write("same.txt", contents);

    SUBCASE("identical path")
    {
        auto result = norm::normalize_file(input, input);

        REQUIRE(std::holds_alternative<norm::FileError>(result));
        CHECK(std::get<norm::FileError>(result).kind == norm::FileError::same_file);
    }

    SUBCASE("different spelling of the same path")
    {
        auto other = (dir / "." / "same.txt").string();
        auto result = norm::normalize_file(input, other);

        REQUIRE(std::holds_alternative<norm::FileError>(result));
        CHECK(std::get<norm::FileError>(result).kind == norm::FileError::same_file);
    }

    CHECK(read(input) == contents);
}

TEST_CASE_FIXTURE(TempDirFixture, "a directory is not a readable input")
{
    auto output = write("output.txt", "keep me\n");

    SUBCASE("normalize leaves the output alone")
    {
        auto result = norm::normalize_file(dir.string(), output);

        REQUIRE(std::holds_alternative<norm::FileError>(result));
        CHECK(std::get<norm::FileError>(result).kind == norm::FileError::read_failed);
        CHECK(read(output) == "keep me\n");
    }

    SUBCASE("check reports it")
    {
        auto result = norm::check_file(dir.string());

        REQUIRE(std::holds_alternative<norm::FileError>(result));
        CHECK(std::get<norm::FileError>(result).kind == norm::FileError::read_failed);
    }
}

TEST_CASE_FIXTURE(TempDirFixture, "existing output is replaced without leftovers")
{
    auto input = write("input.txt", "\uFF21\n");
    auto output = write("output.txt", "old contents that are longer\n");

    auto result = norm::normalize_file(input, output);

    REQUIRE(std::holds_alternative<norm::FileStats>(result));
    CHECK(read(output) == "A\n");
    CHECK_FALSE(fs::exists(output + ".unitool-tmp"));
}

TEST_CASE_FIXTURE(TempDirFixture, "files are checked")
{
    SUBCASE("issues are collected")
    {
        auto path = write("check.txt", "hello\n\u00BD cup\n");
        auto result = norm::check_file(path);

        REQUIRE(std::holds_alternative<norm::CheckReport>(result));
        auto& report = std::get<norm::CheckReport>(result);
        CHECK(report.lines_processed == 2);
        REQUIRE(report.issues.size() == 1);
        CHECK(report.issues[0].line_number == 2);
        CHECK(report.issues[0].normalized_line == "1\u20442 cup");
    }

    SUBCASE("missing file")
    {
        auto result = norm::check_file((dir / "nope.txt").string());

        REQUIRE(std::holds_alternative<norm::FileError>(result));
        CHECK(std::get<norm::FileError>(result).kind == norm::FileError::not_found);
    }
}

TEST_SUITE_END();
