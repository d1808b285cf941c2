#include "lua/config.h"
#include "lua/logging.h"
#include "lua/state.h"
#include "unitool/config.h"
#include "unitool/logging.h"
#include "unitool/normfile.h"
#include "unitool/report.h"
#include "unitool/unitool.h"
#include "unitool/version.h"

#include <algorithm>
#include <basedir.h>
#include <basedir_fs.h>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <string>
#include <string_view>
#include <unistd.h>
#include <variant>
#include <wordexp.h>

#define LOGGER() (logging::get("unitool-main"))

static bool run_file(lua::State* L, const char* path)
{
    std::string err;
    if (!lua::config::run_file(L, path, &err)) {
        LOGGER()->error("lua config error: {}", err);
        return false;
    }

    LOGGER()->debug("ran config {}", path);
    return true;
}

static bool run_config(lua::State* L, xdgHandle* xdg,
        const char* confpatharg)
{
    // try specified path first
    if (confpatharg) {
        if (run_file(L, confpatharg))
            return true;
        else
            LOGGER()->warn(
                    "unable to run specified config ({}); "
                    "looking for " CONFIG_XDG_FILE,
                    confpatharg);
    }

    // try paths from xdgConfigFind. they are null-terminated,
    // with an empty string at the end (double null)
    char* paths = xdgConfigFind(CONFIG_XDG_FILE, xdg);
    if (paths) {
        bool found = false;
        for (char* tmp = paths; *tmp && !found; tmp += std::strlen(tmp) + 1)
            found = run_file(L, tmp);
        std::free(paths);

        if (found)
            return true;
    }

    // finally try CONFIG_FILE, using wordexp to expand ~
    wordexp_t exp_result;
    if (wordexp(CONFIG_FILE, &exp_result, 0) != 0) {
        LOGGER()->warn("unable to expand " CONFIG_FILE);
        return false;
    }

    bool result = false;
    if (exp_result.we_wordc > 0 && access(exp_result.we_wordv[0], R_OK) == 0)
        result = run_file(L, exp_result.we_wordv[0]);
    wordfree(&exp_result);

    return result;
}

static Options load_options(const char* confpath)
{
    lua::State L;
    L.openlibs();
    lua::register_lualogging(&L);
    lua::config::ensure_table(&L);

    {
        xdgHandle xdg;
        if (xdgInitHandle(&xdg)) {
            if (!run_config(&L, &xdg, confpath))
                LOGGER()->debug("no config run, using defaults");
            xdgWipeHandle(&xdg);
        } else
            LOGGER()->warn("unable to read XDG base directories");
    }

    Options options;
    options.max_issues = std::max(0,
            lua::config::get_int(&L, "max_issues", options.max_issues));
    options.strip_bom = lua::config::get_bool(&L, "strip_bom", options.strip_bom);

    LOGGER()->debug("max_issues={} strip_bom={}",
            options.max_issues, options.strip_bom);
    return options;
}

auto usage = std::string_view(R"(
Unicode Normalization Tool
==========================

Usage: unitool [options] <command> [args]

Commands:
  check <filepath>              - Check file for non-normalized text
  normalize <input> <output>    - Normalize file to NFKC form
  compare <string1> <string2>   - Compare two strings and show Unicode info

Options:
  -c, --config FILE     overrides config file
  -d, --debug           enable debug logging
  -h, --help            show help
  -v, --version         show version and exit

Examples:
  unitool check data.csv
  unitool normalize input.csv output.csv
  unitool compare "⽷" "糸"
)");

static void show_usage()
{
    fmt::print("{}", usage);
}

static void show_error(std::string_view message)
{
    fmt::print("Error: {}\n", message);
}

static void flush(const fmt::memory_buffer& buf)
{
    fmt::print("{}", fmt::to_string(buf));
}

static int check_command(const Options& options, const std::string& path)
{
    LOGGER()->info("checking {}", path);

    norm::FileOptions fileopts;
    fileopts.strip_bom = options.strip_bom;
    auto result = norm::check_file(path, fileopts);

    fmt::memory_buffer buf;
    report::format_check(buf, path, result, options.max_issues);
    flush(buf);

    if (auto checked = std::get_if<norm::CheckReport>(&result)) {
        LOGGER()->debug("{} lines, {} issues, {} invalid",
                checked->lines_processed, checked->issues.size(),
                checked->invalid_lines.size());
        return EXIT_SUCCESS;
    }

    return EXIT_FAILURE;
}

static int normalize_command(const Options& options,
        const std::string& input_path, const std::string& output_path)
{
    LOGGER()->info("normalizing {} into {}", input_path, output_path);

    norm::FileOptions fileopts;
    fileopts.strip_bom = options.strip_bom;
    auto result = norm::normalize_file(input_path, output_path, fileopts);

    fmt::memory_buffer buf;
    report::format_normalize(buf, input_path, output_path, result);
    flush(buf);

    if (std::holds_alternative<norm::FileError>(result))
        return EXIT_FAILURE;
    return EXIT_SUCCESS;
}

static int compare_command(const std::string& string1,
        const std::string& string2)
{
    fmt::memory_buffer buf;
    report::format_compare(buf, string1, string2);
    flush(buf);

    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    fmt::print("Unicode Normalization Tool Version: {}\n", version_string());

    const char* confpath = nullptr;
    bool debug = false;

    static const option long_options[] = {
            {"config", required_argument, nullptr, 'c'},
            {"debug", no_argument, nullptr, 'd'},
            {"help", no_argument, nullptr, 'h'},
            {"version", no_argument, nullptr, 'v'},
            {nullptr, 0, nullptr, 0}};

    // '+' stops at the command, so compare args may start with '-'
    int opt;
    while ((opt = getopt_long(argc, argv, "+c:dhv", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                confpath = optarg;
                break;
            case 'd':
                debug = true;
                break;
            case 'h':
                show_usage();
                return EXIT_SUCCESS;
            case 'v':
                // version was already printed
                return EXIT_SUCCESS;
            default:
                show_usage();
                return EXIT_FAILURE;
        }
    }

    if (debug)
        logging::default_level(logging::debug);

    if (optind >= argc) {
        show_usage();
        return EXIT_SUCCESS;
    }

    std::string command{argv[optind]};
    std::transform(command.begin(), command.end(), command.begin(),
            [](unsigned char c) { return std::tolower(c); });
    int nargs = argc - optind - 1;
    char** args = argv + optind + 1;

    int needed = 0;
    if (command == "check") {
        needed = 1;
        if (nargs < needed)
            show_error("Please specify a file path");
    } else if (command == "normalize") {
        needed = 2;
        if (nargs < needed)
            show_error("Please specify input and output file paths");
    } else if (command == "compare") {
        needed = 2;
        if (nargs < needed)
            show_error("Please specify two strings to compare");
    } else {
        LOGGER()->debug("unknown command '{}'", command);
        show_usage();
        return EXIT_FAILURE;
    }

    if (nargs < needed)
        return EXIT_FAILURE;

    try {
        auto options = load_options(confpath);

        if (command == "check")
            return check_command(options, args[0]);
        else if (command == "normalize")
            return normalize_command(options, args[0], args[1]);
        else
            return compare_command(args[0], args[1]);
    } catch (const norm::InvalidInputError& e) {
        LOGGER()->debug("invalid input: {}", e.what());
        show_error(fmt::format("input is not valid UTF-8 ({})", e.what()));
    } catch (const norm::NormalizerError& e) {
        LOGGER()->error("normalizer error: {}", e.what());
    }

    return EXIT_FAILURE;
}
