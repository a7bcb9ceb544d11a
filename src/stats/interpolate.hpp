#ifndef STATS_INTERPOLATE_HPP
#define STATS_INTERPOLATE_HPP

#include <cmath>
#include "data/data.hpp"

namespace NDStats
{
    /*
     * Position of a quantile within n ordered values, using the zero-indexed convention
     * r = q * (n - 1). lo and hi are the order statistics bracketing r.
     */

    struct RankPosition
    {
        Index lo, hi;

        // r - lo, in [0,1)
        Real frac;
    };

    inline RankPosition rankPosition(Probability q, Index n)
    {
        const auto r = q.p * (n - 1.0);

        RankPosition x;
        x.lo   = static_cast<Index>(std::floor(r));
        x.hi   = static_cast<Index>(std::ceil(r));
        x.frac = r - std::floor(r);

        // Guard against rounding pushing hi past the last element
        if (x.hi >= n) { x.hi = n - 1; }
        if (x.lo > x.hi) { x.lo = x.hi; }

        return x;
    }

    /*
     * Combines the two order statistics around a fractional rank. Nearest rounds half up, so a
     * fraction of exactly 0.5 picks the higher value. For integral types Linear truncates
     * towards zero.
     */

    template <typename T> T interpolate(const T &lower, const T &upper, Real frac, Interpolation m)
    {
        switch (m)
        {
            case Interpolation::Lower:   { return lower; }
            case Interpolation::Higher:  { return upper; }
            case Interpolation::Nearest: { return frac < 0.5 ? lower : upper; }

            case Interpolation::Midpoint:
            {
                // Keeps infinities intact; NaN is never equal so it propagates
                if (lower == upper)
                {
                    return lower;
                }

                return lower + (upper - lower) / static_cast<T>(2);
            }

            case Interpolation::Linear:
            {
                // Also keeps infinities intact
                if (frac == 0.0)
                {
                    return lower;
                }

                return static_cast<T>(lower + (upper - lower) * frac);
            }
        }

        return lower;
    }

    inline std::string toString(Interpolation m)
    {
        switch (m)
        {
            case Interpolation::Lower:    { return "lower";    }
            case Interpolation::Higher:   { return "higher";   }
            case Interpolation::Nearest:  { return "nearest";  }
            case Interpolation::Midpoint: { return "midpoint"; }
            case Interpolation::Linear:   { return "linear";   }
        }

        return "linear";
    }
}

#endif
