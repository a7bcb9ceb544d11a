#include <cmath>
#include <algorithm>
#include "hist/edges.hpp"

using namespace NDStats;

Edges::Edges(const std::vector<Real> &x) : _x(x)
{
    for (const auto &i : _x)
    {
        if (std::isnan(i))
        {
            throw UndefinedOrderError("bin edges");
        }
    }

    std::sort(_x.begin(), _x.end());
    _x.erase(std::unique(_x.begin(), _x.end()), _x.end());

    if (_x.size() < 2)
    {
        throw DegenerateSampleError("at least two distinct edges are needed for a bin");
    }
}

boost::optional<Index> Edges::indexOf(Real x) const
{
    if (std::isnan(x) || x < _x.front() || x > _x.back())
    {
        return boost::none;
    }
    else if (x == _x.back())
    {
        // The last bin is closed
        return bins() - 1;
    }

    const auto i = std::upper_bound(_x.begin(), _x.end(), x) - _x.begin();
    return static_cast<Index>(i - 1);
}

std::pair<Real, Real> Edges::rangeOf(Index bin) const
{
    if (bin >= bins())
    {
        throw std::out_of_range((boost::format("Bin %1% out of range for %2% bins") % bin % bins()).str());
    }

    return std::make_pair(_x[bin], _x[bin + 1]);
}
