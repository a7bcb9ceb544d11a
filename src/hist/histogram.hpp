#ifndef HIST_HISTOGRAM_HPP
#define HIST_HISTOGRAM_HPP

#include "hist/grid.hpp"
#include "data/counts.hpp"

namespace NDStats
{
    /*
     * Counts of observations over a Grid. Points outside the grid are dropped and tallied in
     * outOfRange(). The histogram keeps a reference to its grid, which must outlive it.
     */

    class Histogram
    {
        public:

            Histogram(const Grid &grid) : _grid(grid), _counts(grid.shape()), _out(0) {}

            // Returns false if the point was outside the grid
            bool addObservation(const Point &);

            template <typename D> bool addObservation(const Eigen::MatrixBase<D> &p)
            {
                return record(_grid.indexOf(p));
            }

            // Each row is a point
            void addAll(const Matrix &points);

            void addAll(const std::vector<Point> &points);

            // Adds the counts of a histogram over the same grid
            void merge(const Histogram &);

            inline const Grid &grid() const { return _grid; }

            inline const Counts &counts() const { return _counts; }

            // Number of observations dropped for being outside the grid
            inline Count outOfRange() const { return _out; }

            // Number of observations added, including those outside the grid
            inline Count observations() const { return _counts.sum() + _out; }

            inline Index ndim() const { return _grid.ndim(); }

        private:

            bool record(const boost::optional<BinCoord> &);

            const Grid &_grid;

            Counts _counts;

            Count _out;
    };

    Histogram histogram(const Matrix &points, const Grid &grid);
}

#endif
