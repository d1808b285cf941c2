#define ANKERL_NANOBENCH_IMPLEMENT
#include "nanobench.h"

// todo: better way than extern.

void bench_utf8_decoding(ankerl::nanobench::Config& cfg);
void bench_utf8_validation(ankerl::nanobench::Config& cfg);
void bench_normalize(ankerl::nanobench::Config& cfg);
void bench_diff(ankerl::nanobench::Config& cfg);

int main()
{
    auto cfg = ankerl::nanobench::Config();

    bench_utf8_decoding(cfg);
    bench_utf8_validation(cfg);
    bench_normalize(cfg);
    bench_diff(cfg);
}
