#ifndef STATS_INTERNAL_STATS_HPP
#define STATS_INTERNAL_STATS_HPP

#include <string>
#include "stats/internal/order.hpp"

namespace NDStats
{
    namespace Internal
    {
        template <typename T> Real sum(const T &x)
        {
            auto s = 0.0;

            for (Index i = 0; i < length(x); i++)
            {
                s += x[i];
            }

            return s;
        }

        template <typename T> Count count(const T &x)
        {
            return static_cast<Count>(length(x));
        }

        template <typename T> void checkNotEmpty(const T &x, const std::string &what)
        {
            if (!length(x))
            {
                throw EmptyInputError(what);
            }
        }

        template <typename T1, typename T2> void checkSameLength(const T1 &x, const T2 &y)
        {
            if (length(x) != length(y))
            {
                throw DimensionMismatchError(length(x), length(y));
            }
        }

        // Sum of squared deviations from the mean
        template <typename T> Real sumSq(const T &x, Real mean)
        {
            auto accum = 0.0;

            for (Index i = 0; i < length(x); i++)
            {
                const auto d = x[i] - mean;
                accum += d * d;
            }

            return accum;
        }

        /*
         * Index of the extreme element under less, failing on NaN unless skipNaN is set. When
         * every element is NaN and skipNaN is set, the first index is returned.
         */

        template <typename T, typename C> Index extreme(const T &x, C less, bool skipNaN, const std::string &what)
        {
            checkNotEmpty(x, what);

            Index m = 0;
            auto found = false;

            for (Index i = 0; i < length(x); i++)
            {
                if (NDStats::isNaN(x[i]))
                {
                    if (!skipNaN) { throw UndefinedOrderError(what); }
                    continue;
                }

                if (!found || less(x[i], x[m]))
                {
                    m = i;
                    found = true;
                }
            }

            return m;
        }
    }
}

#endif
