#ifdef UNIT_TEST

#include <random>
#include <functional>
#include <algorithm>
#include <cmath>
#include <limits>
#include <catch2/catch.hpp>
#include "stats/matrix.hpp"
#include "stats/internal/select.hpp"

using namespace NDStats;

static const auto NaN = std::numeric_limits<double>::quiet_NaN();

static std::vector<double> sample(unsigned seed, std::size_t n)
{
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(-50, 50);

    std::vector<double> x;

    for (auto i = 0u; i < n; i++)
    {
        x.push_back(dist(gen));
    }

    return x;
}

TEST_CASE("TotalLess_1")
{
    TotalLess<double> less;

    REQUIRE(less(1.0, 2.0));
    REQUIRE(!less(2.0, 1.0));
    REQUIRE(less(1.0, NaN));
    REQUIRE(!less(NaN, 1.0));
    REQUIRE(!less(NaN, NaN));
    REQUIRE(less(std::numeric_limits<double>::infinity(), NaN));
}

TEST_CASE("Ordered_1")
{
    REQUIRE(wrap(1.0) < wrap(NaN));
    REQUIRE(wrap(NaN) == wrap(NaN));
    REQUIRE(wrap(NaN) >= wrap(5.0));
    REQUIRE(wrap(2.0) != wrap(3.0));
    REQUIRE(unwrap(wrap(2.5)) == 2.5);
}

TEST_CASE("ApplyNaNPolicy_1")
{
    std::vector<double> x { NaN, 1.0, NaN, 2.0, 3.0 };

    REQUIRE(applyNaNPolicy(x, x.size(), NaNPolicy::Greatest, "test") == 5);
    REQUIRE_THROWS_AS(applyNaNPolicy(x, x.size(), NaNPolicy::Fail, "test"), UndefinedOrderError);

    const auto n = applyNaNPolicy(x, x.size(), NaNPolicy::Skip, "test");

    REQUIRE(n == 3);
    REQUIRE(x.size() == 5);

    for (auto i = 0u; i < n; i++)       { REQUIRE(!std::isnan(x[i])); }
    for (auto i = n; i < x.size(); i++) { REQUIRE(std::isnan(x[i]));  }
}

TEST_CASE("SelectNth_1")
{
    std::vector<double> x { 5, 3, 1, 4, 2 };

    REQUIRE(selectNth(x, 2) == 3);
    REQUIRE(x[2] == 3);

    for (auto i = 0u; i < 2; i++) { REQUIRE(x[i] <= 3); }
    for (auto i = 3u; i < 5; i++) { REQUIRE(x[i] >= 3); }
}

TEST_CASE("SelectNth_2")
{
    std::vector<double> x;

    REQUIRE_THROWS_AS(selectNth(x, 0), EmptyInputError);

    x.push_back(1.0);

    REQUIRE(selectNth(x, 0) == 1.0);
    REQUIRE_THROWS_AS(selectNth(x, 1), std::out_of_range);
}

TEST_CASE("SelectNth_3")
{
    const auto x = sample(1234, 1000);

    auto sorted = x;
    std::sort(sorted.begin(), sorted.end());

    for (const auto k : { 0u, 1u, 15u, 16u, 17u, 250u, 500u, 998u, 999u })
    {
        auto y = x;
        const auto v = selectNth(y, k);

        REQUIRE(v == sorted[k]);

        for (auto i = 0u; i < k; i++)            { REQUIRE(y[i] <= v); }
        for (auto i = k + 1; i < y.size(); i++)  { REQUIRE(y[i] >= v); }

        // Same multiset
        std::sort(y.begin(), y.end());
        REQUIRE(y == sorted);
    }
}

TEST_CASE("SelectNth_4")
{
    std::vector<double> x { NaN, 1, 3, NaN, 2 };

    REQUIRE(selectNth(x, 0) == 1);
    REQUIRE(selectNth(x, 2) == 3);
    REQUIRE(std::isnan(selectNth(x, 3)));
    REQUIRE(std::isnan(selectNth(x, 4)));
}

TEST_CASE("SelectNth_5")
{
    std::vector<int> x { 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 1, 9 };

    REQUIRE(selectNth(x, 0)  == 1);
    REQUIRE(selectNth(x, 10) == 7);
    REQUIRE(selectNth(x, 20) == 9);
}

TEST_CASE("SelectNth_6")
{
    std::vector<double> x { 5, 3, 1, 4, 2 };

    // Largest first
    REQUIRE(selectNth(x, 0, std::greater<double>()) == 5);
    REQUIRE(selectNth(x, 4, std::greater<double>()) == 1);
}

TEST_CASE("SelectNth_7")
{
    Vector x(5);
    x << 5, 3, 1, 4, 2;

    REQUIRE(selectNth(x, 1) == 2);
    REQUIRE(x.sum() == 15);
}

TEST_CASE("SelectMany_1")
{
    std::vector<double> x { 5, 1, 4, 2, 3 };

    const auto r = selectMany(x, std::vector<Index> { 4, 0, 2, 2 });

    REQUIRE(r.size() == 4);
    REQUIRE(r[0] == 5);
    REQUIRE(r[1] == 1);
    REQUIRE(r[2] == 3);
    REQUIRE(r[3] == 3);
}

TEST_CASE("SelectMany_2")
{
    const auto x = sample(99, 500);

    auto sorted = x;
    std::sort(sorted.begin(), sorted.end());

    const std::vector<Index> ks { 499, 0, 100, 101, 250, 17, 480 };

    auto y = x;
    const auto r = selectMany(y, ks);

    for (auto i = 0u; i < ks.size(); i++)
    {
        REQUIRE(r[i] == sorted[ks[i]]);
        REQUIRE(y[ks[i]] == sorted[ks[i]]);
    }

    std::sort(y.begin(), y.end());
    REQUIRE(y == sorted);
}

TEST_CASE("SelectMany_3")
{
    std::vector<double> x;

    REQUIRE(selectMany(x, std::vector<Index>()).empty());
    REQUIRE_THROWS_AS(selectMany(x, std::vector<Index> { 0 }), EmptyInputError);

    x = { 1, 2, 3 };
    REQUIRE_THROWS_AS(selectMany(x, std::vector<Index> { 0, 3 }), std::out_of_range);
}

#endif
