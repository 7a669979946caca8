// bench/main.cpp - benchmark entry point
// nanobench needs implementation defined in exactly one translation unit

#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>

// nanobench has no auto-registration, each file exposes a runner called from here
namespace bench
{
    void run_drain_benchmarks();
    void run_text_benchmarks();
} // namespace bench

int main()
{
    bench::run_drain_benchmarks();
    bench::run_text_benchmarks();
    return 0;
}
