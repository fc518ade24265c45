#pragma once
#include <algorithm>
#include <vector>
#include <queue>
#include <cstdint>
#include <functional>
#include <string>
#include "workloads.hpp" // for Row, Sink, Dist, time_ns, generators

using StlMinQueue = std::priority_queue<std::uint64_t, std::vector<std::uint64_t>, std::greater<std::uint64_t>>;

// --- std::priority_queue ---
inline Row run_heap_stl_pushpop(std::size_t N, Dist dist, int trial, std::uint64_t seed, bool with_reserve)
{
    Sink s;
    auto keys = gen_keys(dist, N, seed);
    std::vector<std::uint64_t> backing;
    if (with_reserve)
        backing.reserve(N);
    StlMinQueue pq(std::greater<std::uint64_t>(), std::move(backing));
    std::uint64_t ns = time_ns([&]
                               {
        for (auto k: keys) pq.push(k);
        while(!pq.empty()){ s.eat(pq.top()); pq.pop(); } });
    return Row{"binary_heap", "stl", with_reserve ? "push_then_pop_all(reserve)" : "push_then_pop_all",
               dist_name(dist), "", N, trial, seed, ns, s.acc};
}

// --- std::make_heap over an adopted vector ---
inline Row run_heap_stl_heapify(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(dist, N, seed);
    std::uint64_t ns = time_ns([&]
                               {
        StlMinQueue pq(std::greater<std::uint64_t>(), std::move(keys));
        while(!pq.empty()){ s.eat(pq.top()); pq.pop(); } });
    return Row{"binary_heap", "stl", "heapify_then_pop_all", dist_name(dist), "", N, trial, seed, ns, s.acc};
}
