#ifndef HIST_STRATEGIES_HPP
#define HIST_STRATEGIES_HPP

#include <string>
#include <vector>
#include "hist/edges.hpp"

namespace NDStats
{
    /*
     * Rules estimating the number of bins for a sample of size n:
     *
     *   Sturges          ceil(log2(n) + 1)
     *   Rice             ceil(2 * n^(1/3))
     *   Sqrt             ceil(sqrt(n))
     *   Scott            width 3.49 * SD * n^(-1/3)       (population SD)
     *   FreedmanDiaconis width 2 * IQR * n^(-1/3)
     *   Auto             the larger bin count of Sturges and FreedmanDiaconis
     *
     * Width rules give ceil((max - min) / width) bins, and a single bin when the width is zero.
     * A width rule asking for more than max(n, MaxBins) bins throws DegenerateSampleError; this
     * happens when a few outliers sit far from a tightly packed bulk.
     */

    const Index MaxBins = 65536;

    enum class BinRule
    {
        Sturges,
        Rice,
        Sqrt,
        Scott,
        FreedmanDiaconis,
        Auto,
    };

    std::string toString(BinRule);

    // Throws EmptyInputError, UndefinedOrderError (NaN) or DegenerateSampleError (zero range)
    Index binCount(const std::vector<Real> &, BinRule);

    // binCount(x, rule) + 1 edges spread evenly over [min(x), max(x)]
    Edges edges(const std::vector<Real> &, BinRule);

    // n equal-width bins over [min, max]; the last edge is exactly max
    Edges uniformEdges(Real min, Real max, Index n);

    template <typename T> Edges edges(const T &x, BinRule rule)
    {
        std::vector<Real> y;

        for (auto i = 0; i < x.size(); i++)
        {
            y.push_back(static_cast<Real>(x[i]));
        }

        return edges(y, rule);
    }
}

#endif
