#include "nanobench.h"
#include "unitool/utf8.h"

#include <string_view>

using namespace std::literals;

extern const char* unicode_text;

void bench_utf8_decoding(ankerl::nanobench::Config& cfg)
{
    std::size_t count = 0;
    cfg.minEpochIterations(40).run("utf8 counting code points", [&] {
        count += utf8length(unicode_text);
    }).doNotOptimizeAway(&count);

    std::size_t total = 0;
    cfg.minEpochIterations(40).run("utf8 to code points", [&] {
        total += utf8to32(unicode_text).size();
    }).doNotOptimizeAway(&total);
}

void bench_utf8_validation(ankerl::nanobench::Config& cfg)
{
    int valid = 0;
    cfg.minEpochIterations(40).run("utf8 validating text", [&] {
        valid += utf8valid(unicode_text);
    }).doNotOptimizeAway(&valid);

    std::size_t pos = 0;
    cfg.minEpochIterations(40).run("utf8 validating malformed", [&] {
        utf8valid("caf\xC3 au lait, na\xC3\xAFve \xED\xA0\x80"sv, &pos);
    }).doNotOptimizeAway(&pos);
}
