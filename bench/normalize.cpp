#include "nanobench.h"
#include "unitool/normalizer.h"
#include "unitool/utf8.h"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

extern const char* unicode_text;

static std::vector<std::string> lines()
{
    std::vector<std::string> result;
    std::istringstream in{unicode_text};
    std::string line;
    while (std::getline(in, line))
        result.push_back(line);
    return result;
}

void bench_normalize(ankerl::nanobench::Config& cfg)
{
    auto sample = lines();

    std::size_t total = 0;
    cfg.minEpochIterations(10).run("normalize nfkc", [&] {
        for (auto& line : sample)
            total += norm::normalize(line).size();
    }).doNotOptimizeAway(&total);

    int found = 0;
    cfg.minEpochIterations(10).run("check lines", [&] {
        int line_number = 0;
        for (auto& line : sample)
            found += norm::check_line(++line_number, line).has_value();
    }).doNotOptimizeAway(&found);

    int normalized = 0;
    cfg.minEpochIterations(10).run("is normalized", [&] {
        for (auto& line : sample)
            normalized += norm::is_normalized(line);
    }).doNotOptimizeAway(&normalized);
}

void bench_diff(ankerl::nanobench::Config& cfg)
{
    std::vector<std::pair<std::u32string, std::u32string>> pairs;
    for (auto& line : lines())
        pairs.emplace_back(utf8to32(line), utf8to32(norm::normalize(line)));

    std::size_t total = 0;
    cfg.minEpochIterations(40).run("positional diff", [&] {
        for (auto& [original, normalized] : pairs)
            total += norm::diff(original, normalized).size();
    }).doNotOptimizeAway(&total);
}
