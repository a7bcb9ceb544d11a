#ifdef UNIT_TEST

#include <cmath>
#include <limits>
#include <random>
#include <algorithm>
#include <catch2/catch.hpp>
#include "hist/histogram.hpp"

using namespace NDStats;

static const auto NaN = std::numeric_limits<double>::quiet_NaN();

static std::vector<Real> normal(unsigned seed, std::size_t n)
{
    std::mt19937 gen(seed);
    std::normal_distribution<double> dist(0.0, 1.0);

    std::vector<Real> x;

    for (auto i = 0u; i < n; i++)
    {
        x.push_back(dist(gen));
    }

    return x;
}

TEST_CASE("Counts_1")
{
    Counts c(std::vector<Index> { 2, 3 });

    REQUIRE(c.ndim() == 2);
    REQUIRE(c.size() == 6);
    REQUIRE(c.sum()  == 0);

    c.increment(BinCoord { 1, 2 });
    c.increment(BinCoord { 0, 1 }, 3);

    REQUIRE(c[5] == 1);
    REQUIRE(c[1] == 3);
    REQUIRE(c(BinCoord { 0, 1 }) == 3);
    REQUIRE(c.sum() == 4);
}

TEST_CASE("Counts_2")
{
    Counts c(std::vector<Index> { 2, 3 });

    REQUIRE_THROWS_AS(c.increment(BinCoord { 2, 0 }), std::out_of_range);
    REQUIRE_THROWS_AS(c.increment(BinCoord { 0 }), DimensionMismatchError);
    REQUIRE_THROWS_AS(c.increment(BinCoord { 0, 0 }, -1), std::invalid_argument);
    REQUIRE_THROWS_AS(c += Counts(std::vector<Index> { 3, 2 }), DimensionMismatchError);

    REQUIRE(c.sum() == 0);
}

TEST_CASE("Edges_1")
{
    const Edges e(std::vector<Real> { 3, 0, 1, 2, 2 });

    REQUIRE(e.size() == 4);
    REQUIRE(e.bins() == 3);
    REQUIRE(e.min() == 0);
    REQUIRE(e.max() == 3);
    REQUIRE(e.values() == std::vector<Real> { 0, 1, 2, 3 });
}

TEST_CASE("Edges_2")
{
    const Edges e(std::vector<Real> { 0, 1, 2, 3 });

    REQUIRE(*e.indexOf(0.0) == 0);
    REQUIRE(*e.indexOf(1.0) == 1);
    REQUIRE(*e.indexOf(1.5) == 1);
    REQUIRE(*e.indexOf(3.0) == 2);

    REQUIRE(!e.indexOf(3.1));
    REQUIRE(!e.indexOf(-0.1));
    REQUIRE(!e.indexOf(NaN));

    REQUIRE(e.rangeOf(1) == std::make_pair(1.0, 2.0));
    REQUIRE_THROWS_AS(e.rangeOf(3), std::out_of_range);
}

TEST_CASE("Edges_3")
{
    REQUIRE_THROWS_AS(Edges(std::vector<Real> { 1, 1 }), DegenerateSampleError);
    REQUIRE_THROWS_AS(Edges(std::vector<Real>()), DegenerateSampleError);
    REQUIRE_THROWS_AS(Edges(std::vector<Real> { 0, NaN, 1 }), UndefinedOrderError);
}

TEST_CASE("BinCount_1")
{
    std::vector<Real> x;
    for (auto i = 0; i < 10; i++) { x.push_back(i); }

    REQUIRE(binCount(x, BinRule::Sturges) == 5);
    REQUIRE(binCount(x, BinRule::Rice)    == 5);
    REQUIRE(binCount(x, BinRule::Sqrt)    == 4);

    // IQR 4.5, width 2 * 4.5 / 10^(1/3)
    REQUIRE(binCount(x, BinRule::FreedmanDiaconis) == 3);
    REQUIRE(binCount(x, BinRule::Auto) == 5);
}

TEST_CASE("BinCount_2")
{
    REQUIRE_THROWS_AS(binCount(std::vector<Real> { 1, 1, 1, 1 }, BinRule::FreedmanDiaconis), DegenerateSampleError);
    REQUIRE_THROWS_AS(binCount(std::vector<Real>(), BinRule::Sturges), EmptyInputError);
    REQUIRE_THROWS_AS(binCount(std::vector<Real> { 1, NaN, 2 }, BinRule::Sturges), UndefinedOrderError);
}

TEST_CASE("BinCount_3")
{
    // Quartiles coincide, so Freedman-Diaconis falls back to a single bin
    const std::vector<Real> x { 0, 0, 0, 0, 0, 0, 0, 10 };

    REQUIRE(binCount(x, BinRule::FreedmanDiaconis) == 1);
    REQUIRE(binCount(x, BinRule::Auto) == 4);
}

TEST_CASE("BinCount_4")
{
    // Tight bulk with one far outlier: the Freedman-Diaconis width is tiny against the range
    std::vector<Real> x { 0, 1e-12, 2e-12, 3e-12, 4e-12, 5e-12, 6e-12 };

    x.push_back(1e300);
    REQUIRE_THROWS_AS(binCount(x, BinRule::FreedmanDiaconis), DegenerateSampleError);
    REQUIRE_THROWS_AS(binCount(x, BinRule::Auto), DegenerateSampleError);

    x.back() = 1e6;
    REQUIRE_THROWS_AS(edges(x, BinRule::FreedmanDiaconis), DegenerateSampleError);

    // Count rules don't depend on the spread
    REQUIRE(binCount(x, BinRule::Sturges) == 4);
    REQUIRE(edges(x, BinRule::Sturges).bins() == 4);
}

TEST_CASE("BinCount_5")
{
    std::vector<Real> x;
    for (auto i = 0; i < 10; i++) { x.push_back(i); }

    // Population SD 2.8723, width 3.49 * 2.8723 / 10^(1/3) = 4.6529
    REQUIRE(binCount(x, BinRule::Scott) == 2);

    // Population SD 0.8165, width 1.9758 over a range of 2. The sample SD would give a single bin.
    REQUIRE(binCount(std::vector<Real> { 0, 1, 2 }, BinRule::Scott) == 2);
}

TEST_CASE("BinCount_6")
{
    std::vector<Real> x;
    for (auto i = 0; i < 1001; i++) { x.push_back(i); }

    REQUIRE(binCount(x, BinRule::Sturges) == 11);
    REQUIRE(binCount(x, BinRule::Rice)    == 21);
    REQUIRE(binCount(x, BinRule::Sqrt)    == 32);
}

TEST_CASE("Strategies_1")
{
    const auto x = normal(42, 500);

    for (const auto rule : { BinRule::Sturges,
                             BinRule::Rice,
                             BinRule::Sqrt,
                             BinRule::Scott,
                             BinRule::FreedmanDiaconis,
                             BinRule::Auto })
    {
        const auto e = edges(x, rule);

        REQUIRE(e.size() == binCount(x, rule) + 1);
        REQUIRE(e.min() == *std::min_element(x.begin(), x.end()));
        REQUIRE(e.max() == *std::max_element(x.begin(), x.end()));

        for (auto i = 1u; i < e.size(); i++)
        {
            REQUIRE(e[i - 1] < e[i]);
        }

        // Every observation falls in a bin
        for (const auto &i : x)
        {
            REQUIRE(static_cast<bool>(e.indexOf(i)));
        }
    }
}

TEST_CASE("Strategies_2")
{
    REQUIRE(toString(BinRule::Sturges) == "sturges");
    REQUIRE(toString(BinRule::FreedmanDiaconis) == "fd");
    REQUIRE(toString(BinRule::Auto) == "auto");
}

TEST_CASE("UniformEdges_1")
{
    const auto e = uniformEdges(0.0, 1.0, 4);

    REQUIRE(e.values() == std::vector<Real> { 0, 0.25, 0.5, 0.75, 1.0 });

    REQUIRE_THROWS_AS(uniformEdges(0.0, 1.0, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(uniformEdges(1.0, 1.0, 2), DegenerateSampleError);
}

TEST_CASE("Grid_1")
{
    const Grid g(std::vector<Edges> { Edges(std::vector<Real> { 0, 1, 2, 3 }), Edges(std::vector<Real> { 0, 10 }) });

    REQUIRE(g.ndim() == 2);
    REQUIRE(g.shape() == std::vector<Index> { 3, 1 });

    REQUIRE(*g.indexOf(Point { 1.5, 5.0 }) == BinCoord { 1, 0 });
    REQUIRE(*g.indexOf(Point { 3.0, 10.0 }) == BinCoord { 2, 0 });
    REQUIRE(!g.indexOf(Point { 3.1, 5.0 }));
    REQUIRE(!g.indexOf(Point { 1.0, NaN }));

    REQUIRE_THROWS_AS(g.indexOf(Point { 1.0 }), DimensionMismatchError);

    const auto r = g.rangeOf(BinCoord { 2, 0 });

    REQUIRE(r[0] == std::make_pair(2.0, 3.0));
    REQUIRE(r[1] == std::make_pair(0.0, 10.0));
}

TEST_CASE("Grid_2")
{
    REQUIRE_THROWS_AS(Grid(std::vector<Edges>()), EmptyInputError);
}

TEST_CASE("GridBuilder_1")
{
    Matrix x(9, 2);

    for (auto i = 0; i < 9; i++)
    {
        x(i, 0) = i;
        x(i, 1) = 100.0 - i * i;
    }

    const auto g = GridBuilder::build(x, BinRule::Sqrt);

    REQUIRE(g.shape() == std::vector<Index> { 3, 3 });
    REQUIRE(g.edges(0).min() == 0);
    REQUIRE(g.edges(0).max() == 8);
    REQUIRE(g.edges(1).min() == 36);
    REQUIRE(g.edges(1).max() == 100);

    REQUIRE_THROWS_AS(GridBuilder::build(x, std::vector<BinRule> { BinRule::Sqrt }), DimensionMismatchError);
}

TEST_CASE("Histogram_1")
{
    const Grid g(std::vector<Edges> { Edges(std::vector<Real> { 0, 1, 2, 3 }) });

    Histogram h(g);

    REQUIRE(h.addObservation(Point { 0.5 }));
    REQUIRE(h.addObservation(Point { 1.5 }));
    REQUIRE(h.addObservation(Point { 1.5 }));
    REQUIRE(h.addObservation(Point { 3.0 }));
    REQUIRE(!h.addObservation(Point { 3.1 }));

    REQUIRE(h.counts().data() == std::vector<Count> { 1, 2, 1 });
    REQUIRE(h.outOfRange() == 1);
    REQUIRE(h.observations() == 5);
}

TEST_CASE("Histogram_2")
{
    const auto x = normal(7, 1000);
    const auto y = normal(8, 1000);

    const Matrix p = MatrixTools::fromColumns(std::vector<std::vector<Real>> { x, y });

    // Only covers part of the data
    const Grid g(std::vector<Edges> { uniformEdges(-1.0, 1.0, 5), uniformEdges(-2.0, 0.5, 4) });
    const auto h = histogram(p, g);

    REQUIRE(h.observations() == 1000);
    REQUIRE(h.outOfRange() > 0);
    REQUIRE(h.counts().sum() > 0);
    REQUIRE(h.counts().shape() == std::vector<Index> { 5, 4 });

    Count n = 0;

    for (auto i = 0u; i < x.size(); i++)
    {
        if (x[i] >= -1.0 && x[i] <= 1.0 && y[i] >= -2.0 && y[i] <= 0.5) { n++; }
    }

    REQUIRE(h.counts().sum() == n);
}

TEST_CASE("Histogram_3")
{
    const auto x = normal(11, 600);
    const Grid g(std::vector<Edges> { edges(x, BinRule::Sturges) });

    Histogram h1(g), h2(g), all(g);

    for (auto i = 0u; i < x.size(); i++)
    {
        (i % 2 ? h1 : h2).addObservation(Point { x[i] });
        all.addObservation(Point { x[i] });
    }

    h1.merge(h2);

    REQUIRE(h1.counts() == all.counts());
    REQUIRE(h1.observations() == 600);
    REQUIRE(h1.outOfRange() == 0);
}

TEST_CASE("Histogram_4")
{
    const Grid g1(std::vector<Edges> { Edges(std::vector<Real> { 0, 1, 2 }) });
    const Grid g2(std::vector<Edges> { Edges(std::vector<Real> { 0, 1, 3 }) });

    Histogram h1(g1), h2(g2);

    REQUIRE_THROWS_AS(h1.merge(h2), DimensionMismatchError);

    // Wrong number of columns, nothing is added
    REQUIRE_THROWS_AS(h1.addAll(Matrix::Zero(3, 2)), DimensionMismatchError);
    REQUIRE_THROWS_AS(h1.addAll(std::vector<Point> { Point { 0.5 }, Point { 0.5, 0.5 } }), DimensionMismatchError);
    REQUIRE(h1.observations() == 0);

    h1.addAll(std::vector<Point> { Point { 0.5 }, Point { 1.5 }, Point { 2.5 } });

    REQUIRE(h1.counts().data() == std::vector<Count> { 1, 1 });
    REQUIRE(h1.outOfRange() == 1);
}

#endif
