#pragma once
#include <vector>
#include <random>
#include <cstdint>
#include <cmath>
#include <algorithm>

enum class Dist
{
    Uniform,
    Zipf,
    Descending
};

inline const char *dist_name(Dist d)
{
    switch (d)
    {
    case Dist::Zipf:
        return "zipf";
    case Dist::Descending:
        return "descending";
    default:
        return "uniform";
    }
}

inline std::vector<std::uint64_t>
gen_uniform(std::size_t n, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::uint64_t> d;
    std::vector<std::uint64_t> v;
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        v.push_back(d(rng));
    return v;
}

// Zipf(s) ranks over [1..n]; the rank is kept in the high bits so heavy
// ranks produce many near-ties for the comparator.
inline std::vector<std::uint64_t>
gen_zipf(std::size_t n, double s = 1.2, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> U(0.0, 1.0);
    std::vector<double> cdf(n + 1, 0.0);
    for (std::size_t k = 1; k <= n; ++k)
        cdf[k] = cdf[k - 1] + 1.0 / std::pow((double)k, s);
    for (std::size_t k = 1; k <= n; ++k)
        cdf[k] /= cdf[n];

    std::vector<std::uint64_t> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        double u = U(rng);
        std::size_t k = std::lower_bound(cdf.begin(), cdf.end(), u) - cdf.begin();
        out.push_back(((std::uint64_t)k << 32) | (rng() & 0xffffffffull));
    }
    return out;
}

// Worst case for a min-heap push: every key sifts to the root.
inline std::vector<std::uint64_t>
gen_descending(std::size_t n, std::uint64_t seed = 42)
{
    auto v = gen_uniform(n, seed);
    std::sort(v.begin(), v.end(), [](std::uint64_t a, std::uint64_t b)
              { return a > b; });
    return v;
}

inline std::vector<std::uint64_t> gen_keys(Dist dist, std::size_t n, std::uint64_t seed)
{
    switch (dist)
    {
    case Dist::Zipf:
        return gen_zipf(n, 1.2, seed);
    case Dist::Descending:
        return gen_descending(n, seed);
    default:
        return gen_uniform(n, seed);
    }
}
