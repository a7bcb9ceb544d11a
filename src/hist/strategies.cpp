#include <cmath>
#include <algorithm>
#include "stats/stats.hpp"
#include "stats/quantile.hpp"
#include "hist/strategies.hpp"

using namespace NDStats;

namespace
{
    struct Summary
    {
        Index n;
        Real min, max;

        inline Real range() const { return max - min; }
    };

    Summary summarise(const std::vector<Real> &x)
    {
        if (x.empty())
        {
            throw EmptyInputError("bin edges");
        }

        Summary s;
        s.n   = x.size();
        s.min = s.max = x.front();

        for (const auto &i : x)
        {
            if (std::isnan(i))
            {
                throw UndefinedOrderError("bin edges");
            }

            s.min = std::min(s.min, i);
            s.max = std::max(s.max, i);
        }

        if (!(s.min < s.max))
        {
            throw DegenerateSampleError((boost::format("every value is %1%, no bin of positive width") % s.min).str());
        }

        return s;
    }

    inline Real cubeRoot(Index n) { return std::cbrt(static_cast<Real>(n)); }

    Index countForWidth(const Summary &s, Real width)
    {
        if (!(width > 0.0))
        {
            return 1;
        }

        const auto n = std::ceil(s.range() / width);
        const auto limit = std::max(s.n, MaxBins);

        // Checked as a double, the cast is undefined beyond the range of Index
        if (!std::isfinite(n) || n > static_cast<Real>(limit))
        {
            throw DegenerateSampleError((boost::format("bin width %1% over [%2%, %3%] gives more than %4% bins") % width
                                                                                                              % s.min
                                                                                                              % s.max
                                                                                                              % limit).str());
        }

        return std::max(Index(1), static_cast<Index>(n));
    }

    Index sturges(const Summary &s)
    {
        return static_cast<Index>(std::ceil(std::log2(static_cast<Real>(s.n)) + 1.0));
    }

    Real fdWidth(const std::vector<Real> &x, const Summary &s)
    {
        // Both quartiles from one selection pass
        auto y = x;
        const auto q = quantilesMut(y, std::vector<Real> { 0.25, 0.75 });

        return 2.0 * (q[1] - q[0]) / cubeRoot(s.n);
    }

    Real scottWidth(const std::vector<Real> &x, const Summary &s)
    {
        return 3.49 * SD(x, 0.0) / cubeRoot(s.n);
    }

    Index countBins(const std::vector<Real> &x, const Summary &s, BinRule rule)
    {
        switch (rule)
        {
            case BinRule::Sturges: { return sturges(s); }
            case BinRule::Rice:    { return static_cast<Index>(std::ceil(2.0 * cubeRoot(s.n))); }
            case BinRule::Sqrt:    { return static_cast<Index>(std::ceil(std::sqrt(static_cast<Real>(s.n)))); }
            case BinRule::Scott:   { return countForWidth(s, scottWidth(x, s)); }

            case BinRule::FreedmanDiaconis: { return countForWidth(s, fdWidth(x, s)); }

            case BinRule::Auto:
            {
                const auto w = fdWidth(x, s);

                // No spread between the quartiles, FD can't say anything
                if (!(w > 0.0))
                {
                    return sturges(s);
                }

                return std::max(sturges(s), countForWidth(s, w));
            }
        }

        return sturges(s);
    }
}

std::string NDStats::toString(BinRule rule)
{
    switch (rule)
    {
        case BinRule::Sturges:          { return "sturges"; }
        case BinRule::Rice:             { return "rice";    }
        case BinRule::Sqrt:             { return "sqrt";    }
        case BinRule::Scott:            { return "scott";   }
        case BinRule::FreedmanDiaconis: { return "fd";      }
        case BinRule::Auto:             { return "auto";    }
    }

    return "sturges";
}

Index NDStats::binCount(const std::vector<Real> &x, BinRule rule)
{
    return countBins(x, summarise(x), rule);
}

Edges NDStats::edges(const std::vector<Real> &x, BinRule rule)
{
    const auto s = summarise(x);
    return uniformEdges(s.min, s.max, countBins(x, s, rule));
}

Edges NDStats::uniformEdges(Real min, Real max, Index n)
{
    if (!n)
    {
        throw std::invalid_argument("Number of bins must be positive");
    }
    else if (!(min < max))
    {
        throw DegenerateSampleError((boost::format("range [%1%, %2%] has no positive width") % min % max).str());
    }

    const auto width = (max - min) / n;

    std::vector<Real> x;
    x.reserve(n + 1);

    for (Index i = 0; i < n; i++)
    {
        x.push_back(min + i * width);
    }

    x.push_back(max);

    for (Index i = 1; i < x.size(); i++)
    {
        if (!(x[i - 1] < x[i]))
        {
            throw DegenerateSampleError((boost::format("%1% bins over [%2%, %3%] are narrower than the floating point resolution") % n % min % max).str());
        }
    }

    return Edges(x);
}
