#pragma once
#include <cstdint>
#include <string>
#include <chrono>
#include <iostream>
#include <functional>
#include <vector>
#include <cstdio>

#include "datasets.hpp"
#include "../src/heap.hpp"

// Minimal checksum sink to prevent dead-code elimination.
struct Sink
{
    volatile std::uint64_t acc = 0;
    void eat(std::uint64_t x) { acc ^= x + 0x9e3779b97f4a7c15ull + (acc << 6) + (acc >> 2); }
};

// timing helper
template <class F>
std::uint64_t time_ns(F &&f)
{
    auto t0 = std::chrono::high_resolution_clock::now();
    f();
    auto t1 = std::chrono::high_resolution_clock::now();
    return (std::uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
}

struct Row
{
    std::string ds, impl, workload, dist, params;
    std::size_t N;
    int trial;
    std::uint64_t seed, ns;
    std::uint64_t checksum;
};

// Heap construction knobs shared by the custom workloads.
struct HeapParams
{
    std::size_t capacity = TernaryHeap<std::uint64_t>::default_capacity;
    double growth = TernaryHeap<std::uint64_t>::default_growth;
};

inline std::string describe(const HeapParams &p)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "cap=%zu;growth=%.2f", p.capacity, p.growth);
    return buf;
}

inline void print_csv_header()
{
    std::cout << "ds,impl,workload,N,dist,params,trial,seed,ns,checksum\n";
}

inline void print_row(const Row &r)
{
    std::cout << r.ds << "," << r.impl << "," << r.workload << "," << r.N << "," << r.dist << ","
              << r.params << "," << r.trial << "," << r.seed << "," << r.ns << "," << r.checksum << "\n";
}

using MinHeap = TernaryHeap<std::uint64_t, std::less<std::uint64_t>>;

// ---- Workloads ----

// push N then pop N
inline Row run_heap_pushpop(std::size_t N, Dist dist, int trial, std::uint64_t seed, const HeapParams &p)
{
    Sink s;
    MinHeap h(std::less<std::uint64_t>(), p.capacity, p.growth);
    auto keys = gen_keys(dist, N, seed);

    std::uint64_t ns = time_ns([&]
                               {
        for (auto k: keys) h.push(k);
        while (auto v = h.pop()) s.eat(*v); });

    return Row{"ternary_heap", "custom", "push_then_pop_all", dist_name(dist), describe(p), N, trial, seed, ns, s.acc};
}

// bulk build from an unordered batch, then drain
inline Row run_heap_heapify(std::size_t N, Dist dist, int trial, std::uint64_t seed, const HeapParams &p)
{
    Sink s;
    auto keys = gen_keys(dist, N, seed);

    std::uint64_t ns = time_ns([&]
                               {
        auto h = MinHeap::from_unordered(std::move(keys), std::less<std::uint64_t>(), p.growth);
        while (auto v = h.pop()) s.eat(*v); });

    return Row{"ternary_heap", "custom", "heapify_then_pop_all", dist_name(dist), describe(p), N, trial, seed, ns, s.acc};
}

// build, then re-key a batch of stored values found by linear scan
inline Row run_heap_modify(std::size_t N, Dist dist, int trial, std::uint64_t seed, const HeapParams &p)
{
    Sink s;
    auto keys = gen_keys(dist, N, seed);
    auto h = MinHeap::from_unordered(keys, std::less<std::uint64_t>(), p.growth);
    // each modify is O(N), so keep the batch small
    const std::size_t rounds = N < 64 ? N : 64;
    std::mt19937_64 rng(seed ^ 0x5bd1e995ull);

    std::uint64_t ns = time_ns([&]
                               {
        for (std::size_t i = 0; i < rounds; ++i)
        {
            const std::uint64_t target = keys[rng() % N];
            const std::uint64_t repl = rng();
            s.eat(h.modify([&](std::uint64_t x){ return x == target; }, repl));
        }
        if (!h.empty())
            s.eat(h.top()); });

    return Row{"ternary_heap", "custom", "modify_x64", dist_name(dist), describe(p), N, trial, seed, ns, s.acc};
}
