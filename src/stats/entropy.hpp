#ifndef STATS_ENTROPY_HPP
#define STATS_ENTROPY_HPP

#include <cmath>
#include <limits>
#include "stats/internal/stats.hpp"

/*
 * Information measures for discrete probability distributions, in nats. Inputs are not
 * normalised. By convention 0 * ln(0) = 0.
 */

namespace NDStats
{
    template <typename T> Real entropy(const T &p)
    {
        Internal::checkNotEmpty(p, "entropy");

        auto s = 0.0;

        for (Index i = 0; i < length(p); i++)
        {
            if (p[i] != 0)
            {
                s -= p[i] * std::log(static_cast<Real>(p[i]));
            }
        }

        return s;
    }

    // Infinite when q is zero where p is not
    template <typename T1, typename T2> Real klDivergence(const T1 &p, const T2 &q)
    {
        Internal::checkNotEmpty(p, "KL divergence");
        Internal::checkSameLength(p, q);

        auto s = 0.0;

        for (Index i = 0; i < length(p); i++)
        {
            if (p[i] == 0)
            {
                continue;
            }
            else if (q[i] == 0)
            {
                return std::numeric_limits<Real>::infinity();
            }

            s += p[i] * std::log(static_cast<Real>(p[i]) / q[i]);
        }

        return s;
    }

    template <typename T1, typename T2> Real crossEntropy(const T1 &p, const T2 &q)
    {
        Internal::checkNotEmpty(p, "cross entropy");
        Internal::checkSameLength(p, q);

        auto s = 0.0;

        for (Index i = 0; i < length(p); i++)
        {
            if (p[i] == 0)
            {
                continue;
            }
            else if (q[i] == 0)
            {
                return std::numeric_limits<Real>::infinity();
            }

            s -= p[i] * std::log(static_cast<Real>(q[i]));
        }

        return s;
    }
}

#endif
