#ifndef STATS_QUANTILE_HPP
#define STATS_QUANTILE_HPP

#include <limits>
#include <vector>
#include "stats/matrix.hpp"
#include "stats/interpolate.hpp"
#include "stats/internal/select.hpp"

/*
 * Quantiles by partial ordering. The *Mut functions rearrange the caller's data in place; the
 * others work on a copy. Ranks follow the zero-indexed convention r = q * (n - 1).
 */

namespace NDStats
{
    namespace Internal
    {
        inline std::vector<Probability> toProbabilities(const std::vector<Real> &qs)
        {
            return std::vector<Probability>(qs.begin(), qs.end());
        }

        /*
         * Quantiles of the first n elements of x (n > 0), all resolved by one selection pass.
         * Only the order statistics the interpolation actually reads are selected.
         */

        template <typename S> std::vector<ValueOf<S>> quantilesPrefix(S &x, Index n, const std::vector<Probability> &qs, Interpolation m)
        {
            std::vector<RankPosition> ps;
            std::vector<Index> rs;

            for (const auto &q : qs)
            {
                const auto p = rankPosition(q, n);
                ps.push_back(p);

                switch (m)
                {
                    case Interpolation::Lower:   { rs.push_back(p.lo); break; }
                    case Interpolation::Higher:  { rs.push_back(p.hi); break; }
                    case Interpolation::Nearest: { rs.push_back(p.frac < 0.5 ? p.lo : p.hi); break; }

                    case Interpolation::Midpoint:
                    case Interpolation::Linear:
                    {
                        rs.push_back(p.lo);
                        rs.push_back(p.hi);
                        break;
                    }
                }
            }

            std::sort(rs.begin(), rs.end());
            rs.erase(std::unique(rs.begin(), rs.end()), rs.end());

            selectManyRange(x, 0, n, rs, 0, rs.size(), TotalLess<ValueOf<S>>());

            std::vector<ValueOf<S>> r;

            for (const auto &p : ps)
            {
                r.push_back(interpolate<ValueOf<S>>(x[p.lo], x[p.hi], p.frac, m));
            }

            return r;
        }

        template <typename S> std::vector<ValueOf<S>> quantiles1D(S &x, const std::vector<Probability> &qs, Interpolation m, NaNPolicy nan)
        {
            if (!length(x))
            {
                throw EmptyInputError("quantile of an empty sequence");
            }

            const auto n = applyNaNPolicy(x, length(x), nan, "quantile");

            if (!n)
            {
                throw EmptyInputError("quantile of a sequence with no values other than NaN");
            }

            return quantilesPrefix(x, n, qs, m);
        }

        // Same as quantiles1D for a single matrix lane, except an all-NaN lane gives NaN
        template <typename L> std::vector<ValueOf<L>> quantilesLane(L &x, const std::vector<Probability> &qs, Interpolation m, NaNPolicy nan)
        {
            const auto n = applyNaNPolicy(x, length(x), nan, "quantile");

            if (!n)
            {
                return std::vector<ValueOf<L>>(qs.size(), std::numeric_limits<ValueOf<L>>::quiet_NaN());
            }

            return quantilesPrefix(x, n, qs, m);
        }

        template <typename S> std::vector<ValueOf<const S>> copy(const S &x)
        {
            std::vector<ValueOf<const S>> y;
            y.reserve(length(x));

            for (Index i = 0; i < length(x); i++)
            {
                y.push_back(x[i]);
            }

            return y;
        }
    }

    template <typename S> std::vector<ValueOf<S>> quantilesMut(S &x,
                                                               const std::vector<Real> &qs,
                                                               Interpolation m = Interpolation::Linear,
                                                               NaNPolicy nan = NaNPolicy::Greatest)
    {
        // Validate every query before touching the data
        const auto ps = Internal::toProbabilities(qs);

        if (ps.empty())
        {
            return std::vector<ValueOf<S>>();
        }

        return Internal::quantiles1D(x, ps, m, nan);
    }

    template <typename S> ValueOf<S> quantileMut(S &x,
                                                 Real q,
                                                 Interpolation m = Interpolation::Linear,
                                                 NaNPolicy nan = NaNPolicy::Greatest)
    {
        return quantilesMut(x, std::vector<Real> { q }, m, nan).front();
    }

    template <typename S> std::vector<ValueOf<const S>> quantiles(const S &x,
                                                                  const std::vector<Real> &qs,
                                                                  Interpolation m = Interpolation::Linear,
                                                                  NaNPolicy nan = NaNPolicy::Greatest)
    {
        auto y = Internal::copy(x);
        return quantilesMut(y, qs, m, nan);
    }

    template <typename S> ValueOf<const S> quantile(const S &x,
                                                    Real q,
                                                    Interpolation m = Interpolation::Linear,
                                                    NaNPolicy nan = NaNPolicy::Greatest)
    {
        auto y = Internal::copy(x);
        return quantileMut(y, q, m, nan);
    }

    template <typename S> ValueOf<const S> median(const S &x, NaNPolicy nan = NaNPolicy::Greatest)
    {
        return quantile(x, 0.5, Interpolation::Linear, nan);
    }

    /*
     * Quantiles along an axis of a matrix, rearranging each lane in place. The collapsed axis is
     * replaced by one entry per query: Axis::Rows gives qs.size() x cols, Axis::Cols gives
     * rows x qs.size(). A lane that is entirely NaN under NaNPolicy::Skip gives NaN.
     */

    template <typename D> MatrixOf<typename D::Scalar> quantilesAxisMut(Eigen::MatrixBase<D> &x,
                                                                       Axis axis,
                                                                       const std::vector<Real> &qs,
                                                                       Interpolation m = Interpolation::Linear,
                                                                       NaNPolicy nan = NaNPolicy::Greatest)
    {
        const auto ps = Internal::toProbabilities(qs);

        const auto byRows = axis == Axis::Rows;
        const auto lanes  = byRows ? x.cols() : x.rows();
        const auto len    = byRows ? x.rows() : x.cols();

        if (!len)
        {
            throw EmptyInputError("quantile along an empty axis");
        }

        MatrixOf<typename D::Scalar> r(byRows ? ps.size() : lanes, byRows ? lanes : ps.size());

        for (auto i = 0; i < lanes; i++)
        {
            if (byRows)
            {
                auto lane = x.derived().col(i);
                const auto v = Internal::quantilesLane(lane, ps, m, nan);

                for (auto j = 0u; j < v.size(); j++) { r(j, i) = v[j]; }
            }
            else
            {
                auto lane = x.derived().row(i);
                const auto v = Internal::quantilesLane(lane, ps, m, nan);

                for (auto j = 0u; j < v.size(); j++) { r(i, j) = v[j]; }
            }
        }

        return r;
    }

    template <typename D> VectorOf<typename D::Scalar> quantileAxisMut(Eigen::MatrixBase<D> &x,
                                                                      Axis axis,
                                                                      Real q,
                                                                      Interpolation m = Interpolation::Linear,
                                                                      NaNPolicy nan = NaNPolicy::Greatest)
    {
        const auto r = quantilesAxisMut(x, axis, std::vector<Real> { q }, m, nan);

        if (axis == Axis::Rows)
        {
            return r.row(0).transpose();
        }

        return r.col(0);
    }

    template <typename D> MatrixOf<typename D::Scalar> quantilesAxis(const Eigen::MatrixBase<D> &x,
                                                                    Axis axis,
                                                                    const std::vector<Real> &qs,
                                                                    Interpolation m = Interpolation::Linear,
                                                                    NaNPolicy nan = NaNPolicy::Greatest)
    {
        MatrixOf<typename D::Scalar> y = x;
        return quantilesAxisMut(y, axis, qs, m, nan);
    }

    template <typename D> VectorOf<typename D::Scalar> quantileAxis(const Eigen::MatrixBase<D> &x,
                                                                   Axis axis,
                                                                   Real q,
                                                                   Interpolation m = Interpolation::Linear,
                                                                   NaNPolicy nan = NaNPolicy::Greatest)
    {
        MatrixOf<typename D::Scalar> y = x;
        return quantileAxisMut(y, axis, q, m, nan);
    }
}

#endif
