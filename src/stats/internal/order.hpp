#ifndef STATS_INTERNAL_ORDER_HPP
#define STATS_INTERNAL_ORDER_HPP

#include <cmath>
#include <string>
#include <utility>
#include <type_traits>
#include "data/data.hpp"

namespace NDStats
{
    namespace Internal
    {
        template <typename T> inline bool isNaN(const T &x, std::true_type)  { return std::isnan(x); }
        template <typename T> inline bool isNaN(const T &,  std::false_type) { return false; }
    }

    // Always false for types without a not-a-number value
    template <typename T> inline bool isNaN(const T &x)
    {
        return Internal::isNaN(x, std::is_floating_point<T>());
    }

    // Element type of anything indexable with operator[] (std::vector, Eigen vectors and blocks)
    template <typename S> using ValueOf = typename std::decay<decltype(std::declval<S &>()[0])>::type;

    template <typename S> inline Index length(const S &x)
    {
        return static_cast<Index>(x.size());
    }

    /*
     * Strict total order on T. Every NaN compares equal to every other NaN and greater than
     * any other value, so comparison-based algorithms stay well defined on floating point.
     */

    template <typename T> struct TotalLess
    {
        inline bool operator()(const T &x, const T &y) const
        {
            if (isNaN(y))
            {
                return !isNaN(x);
            }

            return x < y;
        }
    };

    /*
     * Value wrapper whose relational operators follow TotalLess
     */

    template <typename T> class Ordered
    {
        public:

            Ordered(const T &x = T()) : _x(x) {}

            static Ordered wrap(const T &x) { return Ordered(x); }

            inline const T &unwrap() const { return _x; }

            inline bool operator<(const Ordered &o)  const { return TotalLess<T>()(_x, o._x); }
            inline bool operator>(const Ordered &o)  const { return o < *this; }
            inline bool operator<=(const Ordered &o) const { return !(o < *this); }
            inline bool operator>=(const Ordered &o) const { return !(*this < o); }
            inline bool operator==(const Ordered &o) const { return !(*this < o) && !(o < *this); }
            inline bool operator!=(const Ordered &o) const { return !(*this == o); }

        private:

            T _x;
    };

    template <typename T> inline Ordered<T> wrap(const T &x)
    {
        return Ordered<T>::wrap(x);
    }

    template <typename T> inline T unwrap(const Ordered<T> &x)
    {
        return x.unwrap();
    }

    /*
     * Prepares the first n elements of x for a comparison-based statistic and returns how many
     * of them take part. Skip moves every NaN behind the returned count; the buffer keeps the
     * same multiset of values.
     */

    template <typename S> Index applyNaNPolicy(S &x, Index n, NaNPolicy policy, const std::string &what)
    {
        switch (policy)
        {
            case NaNPolicy::Greatest: { return n; }

            case NaNPolicy::Fail:
            {
                for (Index i = 0; i < n; i++)
                {
                    if (isNaN(x[i]))
                    {
                        throw UndefinedOrderError(what);
                    }
                }

                return n;
            }

            case NaNPolicy::Skip:
            {
                using std::swap;

                Index i = 0, j = n;

                while (i < j)
                {
                    if (isNaN(x[i]))
                    {
                        swap(x[i], x[--j]);
                    }
                    else
                    {
                        i++;
                    }
                }

                return j;
            }
        }

        return n;
    }
}

#endif
