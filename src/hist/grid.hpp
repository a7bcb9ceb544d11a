#ifndef HIST_GRID_HPP
#define HIST_GRID_HPP

#include <vector>
#include <utility>
#include "hist/edges.hpp"
#include "stats/matrix.hpp"
#include "hist/strategies.hpp"

namespace NDStats
{
    /*
     * Rectangular N-dimensional binning, the Cartesian product of one Edges per dimension
     */

    class Grid
    {
        public:

            Grid(const std::vector<Edges> &edges);

            inline Index ndim() const { return _edges.size(); }

            // Number of bins along each dimension
            std::vector<Index> shape() const;

            inline const Edges &edges(Index dim) const { return _edges.at(dim); }

            /*
             * Bin coordinate of a point, or none when any coordinate falls outside its dimension.
             * Throws DimensionMismatchError if the point has the wrong number of coordinates.
             */

            boost::optional<BinCoord> indexOf(const Point &) const;

            template <typename D> boost::optional<BinCoord> indexOf(const Eigen::MatrixBase<D> &p) const
            {
                Point x;

                for (auto i = 0; i < p.size(); i++)
                {
                    x.push_back(static_cast<Real>(p(i)));
                }

                return indexOf(x);
            }

            // Boundaries of a bin along each dimension
            std::vector<std::pair<Real, Real>> rangeOf(const BinCoord &) const;

            inline bool operator==(const Grid &o) const { return _edges == o._edges; }
            inline bool operator!=(const Grid &o) const { return _edges != o._edges; }

        private:

            std::vector<Edges> _edges;
    };

    /*
     * Builds a grid from a points matrix where rows are observations and columns are dimensions,
     * estimating the edges of each column with its own rule.
     */

    struct GridBuilder
    {
        static Grid build(const Matrix &points, const std::vector<BinRule> &rules);

        // Same rule for every column
        static Grid build(const Matrix &points, BinRule rule);
    };
}

#endif
