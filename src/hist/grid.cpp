#include "hist/grid.hpp"

using namespace NDStats;

Grid::Grid(const std::vector<Edges> &edges) : _edges(edges)
{
    if (_edges.empty())
    {
        throw EmptyInputError("grid needs at least one dimension");
    }
}

std::vector<Index> Grid::shape() const
{
    std::vector<Index> x;

    for (const auto &e : _edges)
    {
        x.push_back(e.bins());
    }

    return x;
}

boost::optional<BinCoord> Grid::indexOf(const Point &p) const
{
    if (p.size() != ndim())
    {
        throw DimensionMismatchError(ndim(), p.size());
    }

    BinCoord c;
    c.reserve(ndim());

    for (auto i = 0u; i < p.size(); i++)
    {
        const auto b = _edges[i].indexOf(p[i]);

        if (!b)
        {
            return boost::none;
        }

        c.push_back(*b);
    }

    return c;
}

std::vector<std::pair<Real, Real>> Grid::rangeOf(const BinCoord &c) const
{
    if (c.size() != ndim())
    {
        throw DimensionMismatchError(ndim(), c.size());
    }

    std::vector<std::pair<Real, Real>> r;

    for (auto i = 0u; i < c.size(); i++)
    {
        r.push_back(_edges[i].rangeOf(c[i]));
    }

    return r;
}

Grid GridBuilder::build(const Matrix &points, const std::vector<BinRule> &rules)
{
    if (rules.size() != static_cast<Index>(points.cols()))
    {
        throw DimensionMismatchError(points.cols(), rules.size());
    }

    std::vector<Edges> x;

    for (auto j = 0; j < points.cols(); j++)
    {
        x.push_back(edges(MatrixTools::toSTDVect(points.col(j)), rules[j]));
    }

    return Grid(x);
}

Grid GridBuilder::build(const Matrix &points, BinRule rule)
{
    return build(points, std::vector<BinRule>(points.cols(), rule));
}
