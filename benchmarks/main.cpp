#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include "workloads.hpp"
#include "workloads_stl.hpp"
#include "args.hpp"

static void print_metadata(){
    std::fprintf(stderr, "# build: %s %s\n", __DATE__, __TIME__);
#if defined(__clang__)
    std::fprintf(stderr, "# compiler: clang %d\n", __clang_major__);
#elif defined(__GNUC__)
    std::fprintf(stderr, "# compiler: gcc %d\n", __GNUC__);
#endif
#ifdef NDEBUG
    std::fprintf(stderr, "# mode: Release\n");
#else
    std::fprintf(stderr, "# mode: Debug\n");
#endif
}

static void print_config(const Args &a)
{
    std::fprintf(stderr, "# trials: %d dist: %s seed: %llu %s\n", a.trials, dist_name(a.dist),
                 (unsigned long long)a.seed0, describe(a.heap).c_str());
    std::fprintf(stderr, "# sizes:");
    for (auto n : a.sizes)
        std::fprintf(stderr, " %zu", n);
    std::fprintf(stderr, "\n");
}

static void usage(const char *prog)
{
    std::fprintf(stderr,
                 "usage: %s [--trials N] [--dist uniform|zipf|descending] [--seed S]\n"
                 "          [--sizes a,b,c] [--capacity C] [--growth G]\n",
                 prog);
}

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    Args a;
    try
    {
        a = parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "error: %s\n", e.what());
        usage(argv[0]);
        return 2;
    }
    print_metadata();
    print_config(a);
    print_csv_header();

    int trial = 0;
    for (int t = 0; t < a.trials; ++t)
    {
        for (auto N : a.sizes)
        {
            std::uint64_t seed = a.seed0 + t * 1315423911ull + N;

            // ---- Custom ----
            print_row(run_heap_pushpop(N, a.dist, trial, seed, a.heap));
            print_row(run_heap_heapify(N, a.dist, trial, seed + 1, a.heap));
            print_row(run_heap_modify(N, a.dist, trial, seed + 2, a.heap));

            // ---- STL baselines ----
            print_row(run_heap_stl_pushpop(N, a.dist, trial, seed, false));
            print_row(run_heap_stl_pushpop(N, a.dist, trial, seed, true));
            print_row(run_heap_stl_heapify(N, a.dist, trial, seed + 1));

            ++trial;
        }
    }
    return 0;
}
