#ifndef COUNTS_HPP
#define COUNTS_HPP

#include <vector>
#include <numeric>
#include <stdexcept>
#include <functional>
#include "data/data.hpp"

namespace NDStats
{
    /*
     * N-dimensional array of counts, stored flat in row-major order. Counts start at zero and
     * can only go up.
     */

    class Counts
    {
        public:

            Counts(const std::vector<Index> &shape = std::vector<Index>()) : _shape(shape)
            {
                _x.resize(std::accumulate(shape.begin(), shape.end(), Index(1), std::multiplies<Index>()), 0);
            }

            inline const std::vector<Index> &shape() const { return _shape; }

            inline Index ndim() const { return _shape.size(); }

            // Total number of cells
            inline Index size() const { return _x.size(); }

            inline Count operator()(const BinCoord &c) const { return _x[offset(c)]; }

            // Flat access in row-major order
            inline Count operator[](Index i) const { return _x.at(i); }

            inline const std::vector<Count> &data() const { return _x; }

            inline void increment(const BinCoord &c, Count n = 1)
            {
                if (n < 0)
                {
                    throw std::invalid_argument("Counts can only be incremented");
                }

                _x[offset(c)] += n;
            }

            inline Count sum() const
            {
                return std::accumulate(_x.begin(), _x.end(), Count(0));
            }

            Counts &operator+=(const Counts &o)
            {
                if (o._shape != _shape)
                {
                    throw DimensionMismatchError(size(), o.size());
                }

                for (auto i = 0u; i < _x.size(); i++)
                {
                    _x[i] += o._x[i];
                }

                return *this;
            }

            inline bool operator==(const Counts &o) const { return _shape == o._shape && _x == o._x; }

        private:

            Index offset(const BinCoord &c) const
            {
                if (c.size() != _shape.size())
                {
                    throw DimensionMismatchError(_shape.size(), c.size());
                }

                Index i = 0;

                for (auto d = 0u; d < c.size(); d++)
                {
                    if (c[d] >= _shape[d])
                    {
                        throw std::out_of_range((boost::format("Bin %1% out of range for dimension %2% with %3% bins") % c[d] % d % _shape[d]).str());
                    }

                    i = i * _shape[d] + c[d];
                }

                return i;
            }

            std::vector<Index> _shape;
            std::vector<Count> _x;
    };
}

#endif
