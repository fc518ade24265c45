#pragma once
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "datasets.hpp"
#include "workloads.hpp"

struct Args
{
    std::vector<std::size_t> sizes{1024, 4096, 16384, 65536, 262144, 1048576};
    int trials = 8;
    Dist dist = Dist::Uniform;
    std::uint64_t seed0 = 42;
    HeapParams heap;
};

// Unsigned count. std::stoull would wrap a leading '-' around to a huge value.
inline std::uint64_t parse_count(const std::string &tok)
{
    if (tok.empty() || tok.find('-') != std::string::npos)
        throw std::invalid_argument("expected a non-negative number, got '" + tok + "'");
    std::size_t used = 0;
    std::uint64_t v = std::stoull(tok, &used);
    if (used != tok.size())
        throw std::invalid_argument("trailing characters in '" + tok + "'");
    return v;
}

inline int parse_int(const std::string &tok)
{
    std::size_t used = 0;
    int v = std::stoi(tok, &used);
    if (used != tok.size())
        throw std::invalid_argument("trailing characters in '" + tok + "'");
    return v;
}

inline double parse_real(const std::string &tok)
{
    std::size_t used = 0;
    double v = std::stod(tok, &used);
    if (used != tok.size())
        throw std::invalid_argument("trailing characters in '" + tok + "'");
    return v;
}

// Throws std::invalid_argument / std::out_of_range on malformed values.
inline Args parse(int argc, char **argv)
{
    Args a;
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        auto next = [&]() -> std::string
        {
            if (i + 1 >= argc)
                throw std::invalid_argument("missing value for " + s);
            return argv[++i];
        };
        if (s == "--trials")
        {
            a.trials = parse_int(next());
        }
        else if (s == "--dist")
        {
            std::string v = next();
            if (v == "zipf")
                a.dist = Dist::Zipf;
            else if (v == "descending")
                a.dist = Dist::Descending;
            else if (v == "uniform")
                a.dist = Dist::Uniform;
            else
                throw std::invalid_argument("unknown --dist " + v);
        }
        else if (s == "--seed")
        {
            a.seed0 = parse_count(next());
        }
        else if (s == "--capacity")
        {
            a.heap.capacity = parse_count(next());
        }
        else if (s == "--growth")
        {
            a.heap.growth = parse_real(next());
            if (!(a.heap.growth > 1.0) || !std::isfinite(a.heap.growth))
                throw std::invalid_argument("--growth must be finite and > 1");
        }
        else if (s == "--sizes")
        {
            std::string v = next();
            a.sizes.clear();
            std::size_t start = 0;
            while (true)
            {
                auto pos = v.find(',', start);
                std::string tok = (pos == std::string::npos) ? v.substr(start) : v.substr(start, pos - start);
                if (!tok.empty())
                    a.sizes.push_back(parse_count(tok));
                if (pos == std::string::npos)
                    break;
                start = pos + 1;
            }
        }
        else
        {
            throw std::invalid_argument("unknown option " + s);
        }
    }
    return a;
}
