// bench/main.cpp - benchmark entry point
// nanobench needs its implementation defined in exactly one translation unit

#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>

// nanobench has no auto-registration; each file exposes a runner
namespace bench
{
    void run_planner_benchmarks();
    void run_engine_benchmarks();
} // namespace bench

int main()
{
    bench::run_planner_benchmarks();
    bench::run_engine_benchmarks();
    return 0;
}
