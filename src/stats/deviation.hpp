#ifndef STATS_DEVIATION_HPP
#define STATS_DEVIATION_HPP

#include <cmath>
#include "stats/internal/stats.hpp"

/*
 * Distances and error measures between two sequences of the same length
 */

namespace NDStats
{
    namespace Internal
    {
        template <typename T1, typename T2> void checkPair(const T1 &x, const T2 &y)
        {
            checkSameLength(x, y);
            checkNotEmpty(x, "deviation");
        }
    }

    template <typename T1, typename T2> Count countEq(const T1 &x, const T2 &y)
    {
        Internal::checkPair(x, y);

        Count n = 0;

        for (Index i = 0; i < length(x); i++)
        {
            if (x[i] == y[i]) { n++; }
        }

        return n;
    }

    template <typename T1, typename T2> Count countNeq(const T1 &x, const T2 &y)
    {
        return Internal::count(x) - countEq(x, y);
    }

    template <typename T1, typename T2> Real sqL2Dist(const T1 &x, const T2 &y)
    {
        Internal::checkPair(x, y);

        auto s = 0.0;

        for (Index i = 0; i < length(x); i++)
        {
            const auto d = static_cast<Real>(x[i]) - static_cast<Real>(y[i]);
            s += d * d;
        }

        return s;
    }

    template <typename T1, typename T2> Real l2Dist(const T1 &x, const T2 &y)
    {
        return std::sqrt(sqL2Dist(x, y));
    }

    template <typename T1, typename T2> Real l1Dist(const T1 &x, const T2 &y)
    {
        Internal::checkPair(x, y);

        auto s = 0.0;

        for (Index i = 0; i < length(x); i++)
        {
            s += std::fabs(static_cast<Real>(x[i]) - static_cast<Real>(y[i]));
        }

        return s;
    }

    template <typename T1, typename T2> Real linfDist(const T1 &x, const T2 &y)
    {
        Internal::checkPair(x, y);

        auto m = 0.0;

        for (Index i = 0; i < length(x); i++)
        {
            const auto d = std::fabs(static_cast<Real>(x[i]) - static_cast<Real>(y[i]));

            if (std::isnan(d))
            {
                throw UndefinedOrderError("L-infinity distance");
            }
            else if (d > m)
            {
                m = d;
            }
        }

        return m;
    }

    template <typename T1, typename T2> Real meanAbsErr(const T1 &x, const T2 &y)
    {
        return l1Dist(x, y) / Internal::count(x);
    }

    template <typename T1, typename T2> Real meanSqErr(const T1 &x, const T2 &y)
    {
        return sqL2Dist(x, y) / Internal::count(x);
    }

    template <typename T1, typename T2> Real rootMeanSqErr(const T1 &x, const T2 &y)
    {
        return std::sqrt(meanSqErr(x, y));
    }

    // PSNR in decibels; maxRange is the dynamic range of the signal (eg: 255 for 8-bit images)
    template <typename T1, typename T2> Real peakSignalToNoiseRatio(const T1 &x, const T2 &y, Real maxRange)
    {
        const auto mse = meanSqErr(x, y);
        return 10.0 * std::log10(maxRange * maxRange / mse);
    }
}

#endif
