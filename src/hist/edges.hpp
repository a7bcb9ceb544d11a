#ifndef HIST_EDGES_HPP
#define HIST_EDGES_HPP

#include <vector>
#include <utility>
#include <boost/optional.hpp>
#include "data/data.hpp"

namespace NDStats
{
    /*
     * Strictly increasing bin boundaries. n + 1 edges define n bins [e[i], e[i+1]), except the
     * last bin which also includes its upper edge.
     */

    class Edges
    {
        public:

            // Sorts and removes duplicates. Throws DegenerateSampleError for fewer than two distinct edges.
            Edges(const std::vector<Real> &x);

            inline Index bins() const { return _x.size() - 1; }
            inline Index size() const { return _x.size(); }

            inline Real min() const { return _x.front(); }
            inline Real max() const { return _x.back(); }

            inline Real operator[](Index i) const { return _x.at(i); }

            inline const std::vector<Real> &values() const { return _x; }

            // Bin containing x by binary search; none if x is NaN or outside [min, max]
            boost::optional<Index> indexOf(Real x) const;

            // Boundaries of a bin
            std::pair<Real, Real> rangeOf(Index bin) const;

            inline bool operator==(const Edges &o) const { return _x == o._x; }
            inline bool operator!=(const Edges &o) const { return _x != o._x; }

        private:

            std::vector<Real> _x;
    };
}

#endif
