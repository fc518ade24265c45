#include <catch2/catch.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include "../src/vector.hpp"

TEST_CASE("DynArray<int> push_back grows size and capacity") {
  DynArray<int> v;
  REQUIRE(v.size() == 0);
  REQUIRE(v.capacity() == 0);
  const std::size_t N = 128;
  for (int i = 0; i < static_cast<int>(N); ++i) {
    v.push_back(i);
    REQUIRE(v.size() == static_cast<std::size_t>(i + 1));
    REQUIRE(v.capacity() >= v.size());
  }
  // order intact
  for (int i = 0; i < static_cast<int>(N); ++i) {
    REQUIRE(v[i] == i);
  }
}

TEST_CASE("growth factor drives the capacity sequence") {
  DynArray<int> v(1.5);
  v.reserve(4);
  for (int i = 0; i < 4; ++i) v.push_back(i);
  REQUIRE(v.capacity() == 4);
  v.push_back(4);
  REQUIRE(v.capacity() == 6);
  v.push_back(5);
  v.push_back(6);
  REQUIRE(v.capacity() == 9);

  DynArray<int> w;
  w.push_back(1);
  REQUIRE(w.capacity() == 1);
  w.push_back(2);
  REQUIRE(w.capacity() == 2);
  w.push_back(3);
  REQUIRE(w.capacity() == 4);
}

TEST_CASE("a factor just above one still grows by at least a slot") {
  DynArray<int> v(1.01);
  REQUIRE(v.next_capacity(0) == 1);
  REQUIRE(v.next_capacity(10) == 11);
  REQUIRE(v.next_capacity(1000) == 1010);
}

TEST_CASE("growth factor <= 1 is rejected") {
  REQUIRE_THROWS_AS(DynArray<int>(1.0), std::invalid_argument);
  REQUIRE_THROWS_AS(DynArray<int>(0.5), std::invalid_argument);
  REQUIRE_THROWS_AS(DynArray<int>(-2.0), std::invalid_argument);
  REQUIRE_THROWS_AS(DynArray<int>(std::nan("")), std::invalid_argument);
  REQUIRE_THROWS_AS(DynArray<int>(std::numeric_limits<double>::infinity()), std::invalid_argument);
}

TEST_CASE("reserve past max_size throws before allocating") {
  DynArray<int> v;
  v.push_back(3);
  REQUIRE_THROWS_AS(v.reserve(DynArray<int>::max_size() + 1), std::length_error);
  REQUIRE_THROWS_AS(v.reserve(std::size_t(1) << 62), std::length_error);
  REQUIRE(v.size() == 1);
  REQUIRE(v.capacity() == 1);
  REQUIRE(v[0] == 3);
}

TEST_CASE("next_capacity saturates at max_size for huge factors") {
  DynArray<int> v(4611686018427387904.0);
  REQUIRE(v.next_capacity(1) == DynArray<int>::max_size());
  REQUIRE(v.next_capacity(3) == DynArray<int>::max_size());
  DynArray<int> w(1e300);
  REQUIRE(w.next_capacity(2) == DynArray<int>::max_size());
  DynArray<int> d;
  REQUIRE(d.next_capacity(DynArray<int>::max_size()) == DynArray<int>::max_size());
  REQUIRE(d.next_capacity(DynArray<int>::max_size() / 2 + 1) == DynArray<int>::max_size());
}

TEST_CASE("reserve and at() bounds") {
  DynArray<int> v;
  v.reserve(64);
  REQUIRE(v.capacity() >= 64);
  v.push_back(42);
  REQUIRE(v.at(0) == 42);
  REQUIRE_THROWS_AS(v.at(1), std::out_of_range);
}

TEST_CASE("push_back of an element that lives in the full buffer") {
  DynArray<std::string> v;
  v.reserve(2);
  v.push_back("alpha");
  v.push_back("beta");
  REQUIRE(v.size() == v.capacity());
  v.push_back(v[0]);
  REQUIRE(v.size() == 3);
  REQUIRE(v[2] == "alpha");
}

TEST_CASE("copy keeps capacity and growth, and is independent") {
  DynArray<int> a(3.0);
  a.reserve(20);
  for (int i = 0; i < 5; ++i) a.push_back(i);
  DynArray<int> b(a);
  REQUIRE(b.size() == 5);
  REQUIRE(b.capacity() == 20);
  REQUIRE(b.growth() == 3.0);
  b[0] = 99;
  b.pop_back();
  REQUIRE(a[0] == 0);
  REQUIRE(a.size() == 5);
}

TEST_CASE("move leaves the source empty") {
  DynArray<int> a;
  a.push_back(7);
  DynArray<int> b(std::move(a));
  REQUIRE(b.size() == 1);
  REQUIRE(a.size() == 0);
  REQUIRE(a.capacity() == 0);
  a.push_back(8);
  REQUIRE(a.back() == 8);
}

TEST_CASE("clear keeps capacity") {
  DynArray<int> a;
  for (int i = 0; i < 10; ++i) a.push_back(i);
  const auto cap = a.capacity();
  a.clear();
  REQUIRE(a.empty());
  REQUIRE(a.capacity() == cap);
}

struct Tracked {
  static inline int live = 0;
  int x = 0;
  Tracked() : x(0) { ++live; }
  explicit Tracked(int v) : x(v) { ++live; }
  Tracked(const Tracked& o) : x(o.x) { ++live; }
  Tracked(Tracked&& o) noexcept : x(o.x) { o.x = -1; ++live; }
  Tracked& operator=(const Tracked& o) { x = o.x; return *this; }
  Tracked& operator=(Tracked&& o) noexcept { x = o.x; o.x = -1; return *this; }
  ~Tracked() { --live; }
};

TEST_CASE("copy/move semantics keep counts sane") {
  REQUIRE(Tracked::live == 0);
  {
    DynArray<Tracked> v;
    for (int i = 0; i < 16; ++i) v.push_back(Tracked{i});
    v.emplace_back(16);
    REQUIRE(v.size() == 17);
    REQUIRE(Tracked::live == 17);
    DynArray<Tracked> w(v);
    REQUIRE(Tracked::live == 34);
    w.pop_back();
    w.clear();
    REQUIRE(Tracked::live == 17);
  }
  REQUIRE(Tracked::live == 0);
}
