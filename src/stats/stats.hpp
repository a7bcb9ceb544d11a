#ifndef STATS_STATS_HPP
#define STATS_STATS_HPP

#include <cmath>
#include <functional>
#include <stdexcept>
#include "stats/internal/stats.hpp"

namespace NDStats
{
    template <typename T> Real sum(const T &x)
    {
        return Internal::sum(x);
    }

    template <typename T> Real mean(const T &x)
    {
        Internal::checkNotEmpty(x, "mean");
        return Internal::sum(x) / Internal::count(x);
    }

    template <typename T1, typename T2> Real weightedMean(const T1 &x, const T2 &w)
    {
        Internal::checkNotEmpty(x, "weighted mean");
        Internal::checkSameLength(x, w);

        auto s  = 0.0;
        auto sw = 0.0;

        for (Index i = 0; i < length(x); i++)
        {
            s  += w[i] * x[i];
            sw += w[i];
        }

        return s / sw;
    }

    /*
     * Variance with ddof subtracted from n in the denominator: 0 for the population variance,
     * 1 for the unbiased sample variance.
     */

    template <typename T> Real var(const T &x, Real ddof = 0.0)
    {
        Internal::checkNotEmpty(x, "variance");

        const auto n = static_cast<Real>(length(x));

        if (ddof < 0.0 || ddof >= n)
        {
            throw std::invalid_argument((boost::format("ddof must be in [0, %1%), got %2%") % n % ddof).str());
        }

        return Internal::sumSq(x, mean(x)) / (n - ddof);
    }

    template <typename T> Real SD(const T &x, Real ddof = 0.0)
    {
        return std::sqrt(var(x, ddof));
    }

    // Coefficient of variation (sample standard deviation over mean)
    template <typename T> Real CV(const T &x)
    {
        return SD(x, 1.0) / mean(x);
    }

    template <typename T> Real harmonicMean(const T &x)
    {
        Internal::checkNotEmpty(x, "harmonic mean");

        auto s = 0.0;

        for (Index i = 0; i < length(x); i++)
        {
            s += 1.0 / x[i];
        }

        return Internal::count(x) / s;
    }

    // Computed in log space, so it doesn't overflow for long inputs
    template <typename T> Real geometricMean(const T &x)
    {
        Internal::checkNotEmpty(x, "geometric mean");

        auto s = 0.0;

        for (Index i = 0; i < length(x); i++)
        {
            s += std::log(static_cast<Real>(x[i]));
        }

        return std::exp(s / Internal::count(x));
    }

    template <typename T> Index argmin(const T &x)
    {
        return Internal::extreme(x, std::less<ValueOf<const T>>(), false, "argmin");
    }

    template <typename T> Index argmax(const T &x)
    {
        return Internal::extreme(x, std::greater<ValueOf<const T>>(), false, "argmax");
    }

    template <typename T> ValueOf<const T> min(const T &x)
    {
        return x[argmin(x)];
    }

    template <typename T> ValueOf<const T> max(const T &x)
    {
        return x[argmax(x)];
    }

    // Ignores NaN; gives NaN only when every element is NaN
    template <typename T> ValueOf<const T> minSkipNaN(const T &x)
    {
        return x[Internal::extreme(x, std::less<ValueOf<const T>>(), true, "min")];
    }

    template <typename T> ValueOf<const T> maxSkipNaN(const T &x)
    {
        return x[Internal::extreme(x, std::greater<ValueOf<const T>>(), true, "max")];
    }
}

#endif
