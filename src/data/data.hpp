#ifndef DATA_HPP
#define DATA_HPP

#include <cmath>
#include <string>
#include <vector>
#include <cstddef>
#include "tools/errors.hpp"

namespace NDStats
{
    typedef double Real;

    typedef std::size_t Index;
    typedef long long Count;

    typedef std::string Path;
    typedef std::string Label;
    typedef std::string Token;
    typedef std::string Column;
    typedef std::string FileName;

    // Bin index for each binned dimension
    typedef std::vector<Index> BinCoord;

    // A point with one coordinate per binned dimension
    typedef std::vector<Real> Point;

    /*
     * Fraction in [0,1] identifying a position in an ordered sequence. Constructing it
     * from anything else (including NaN) throws InvalidQuantileError.
     */

    struct Probability
    {
        Probability(Real p = 0.0) : p(p)
        {
            if (std::isnan(p) || p < 0.0 || p > 1.0)
            {
                throw InvalidQuantileError(p);
            }
        }

        inline Probability comp() const
        {
            return Probability(1.0 - p);
        }

        // Implicity convert the probability to its underlying type
        inline operator Real() const { return p; }

        Real p;
    };

    enum class Interpolation
    {
        Lower,
        Higher,
        Nearest,
        Midpoint,
        Linear,
    };

    enum class NaNPolicy
    {
        Greatest,   // NaN sorts after every other value
        Skip,       // NaN is removed before computing
        Fail,       // NaN throws UndefinedOrderError
    };
}

#endif
