#include "hist/histogram.hpp"

using namespace NDStats;

bool Histogram::record(const boost::optional<BinCoord> &c)
{
    if (!c)
    {
        _out++;
        return false;
    }

    _counts.increment(*c);
    return true;
}

bool Histogram::addObservation(const Point &p)
{
    return record(_grid.indexOf(p));
}

void Histogram::addAll(const Matrix &points)
{
    // Check up front so a bad matrix adds nothing
    if (static_cast<Index>(points.cols()) != ndim())
    {
        throw DimensionMismatchError(ndim(), points.cols());
    }

    for (auto i = 0; i < points.rows(); i++)
    {
        addObservation(points.row(i));
    }
}

void Histogram::addAll(const std::vector<Point> &points)
{
    for (const auto &p : points)
    {
        if (p.size() != ndim())
        {
            throw DimensionMismatchError(ndim(), p.size());
        }
    }

    for (const auto &p : points)
    {
        addObservation(p);
    }
}

void Histogram::merge(const Histogram &o)
{
    if (o._grid != _grid)
    {
        throw DimensionMismatchError(_counts.size(), o._counts.size());
    }

    _counts += o._counts;
    _out    += o._out;
}

Histogram NDStats::histogram(const Matrix &points, const Grid &grid)
{
    Histogram h(grid);
    h.addAll(points);
    return h;
}
