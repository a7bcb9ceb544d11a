#ifndef STATS_INTERNAL_SELECT_HPP
#define STATS_INTERNAL_SELECT_HPP

#include <vector>
#include <utility>
#include <algorithm>
#include <stdexcept>
#include "stats/internal/order.hpp"

/*
 * Quickselect over any mutable sequence with operator[] and size(). Every rearrangement is a
 * swap, so the buffer holds the same multiset of values at every point, including when a
 * user-supplied comparator throws.
 *
 * Pivot rule: median of the first, middle and last element of the active range. The partition
 * is three-way (less / equal / greater), so runs of equal values are settled in a single pass.
 * Ranges of up to 16 elements are finished with insertion sort. The rule is deterministic: the
 * same input always ends in the same order.
 */

namespace NDStats
{
    namespace Internal
    {
        const Index SmallRange = 16;

        template <typename S, typename C> void insertionSort(S &x, Index lo, Index hi, C less)
        {
            using std::swap;

            for (Index i = lo + 1; i < hi; i++)
            {
                for (Index j = i; j > lo && less(x[j], x[j - 1]); j--)
                {
                    swap(x[j], x[j - 1]);
                }
            }
        }

        template <typename S, typename C> Index medianOf3(const S &x, Index a, Index b, Index c, C less)
        {
            if (less(x[a], x[b]))
            {
                if (less(x[b], x[c])) { return b; }
                return less(x[a], x[c]) ? c : a;
            }
            else
            {
                if (less(x[a], x[c])) { return a; }
                return less(x[b], x[c]) ? c : b;
            }
        }

        // Moves the smallest element of [lo, hi) to lo
        template <typename S, typename C> void moveMin(S &x, Index lo, Index hi, C less)
        {
            using std::swap;

            auto m = lo;
            for (auto i = lo + 1; i < hi; i++)
            {
                if (less(x[i], x[m])) { m = i; }
            }

            swap(x[lo], x[m]);
        }

        // Moves the largest element of [lo, hi) to hi - 1
        template <typename S, typename C> void moveMax(S &x, Index lo, Index hi, C less)
        {
            using std::swap;

            auto m = lo;
            for (auto i = lo + 1; i < hi; i++)
            {
                if (!less(x[i], x[m])) { m = i; }
            }

            swap(x[hi - 1], x[m]);
        }

        /*
         * Three-way partition of [lo, hi) around the value at p. Returns [lt, gt) such that
         * everything before lt is less than the pivot, everything in [lt, gt) is equal to it and
         * everything from gt onwards is greater.
         */

        template <typename S, typename C> std::pair<Index, Index> partition3(S &x, Index lo, Index hi, Index p, C less)
        {
            using std::swap;

            const ValueOf<S> pivot = x[p];

            auto lt = lo;
            auto gt = hi;
            auto i  = lo;

            while (i < gt)
            {
                if (less(x[i], pivot))
                {
                    swap(x[lt++], x[i++]);
                }
                else if (less(pivot, x[i]))
                {
                    swap(x[i], x[--gt]);
                }
                else
                {
                    i++;
                }
            }

            return std::make_pair(lt, gt);
        }

        template <typename S, typename C> void selectRange(S &x, Index lo, Index hi, Index k, C less)
        {
            for (;;)
            {
                if (hi - lo <= SmallRange)
                {
                    insertionSort(x, lo, hi, less);
                    return;
                }
                else if (k == lo)
                {
                    moveMin(x, lo, hi, less);
                    return;
                }
                else if (k == hi - 1)
                {
                    moveMax(x, lo, hi, less);
                    return;
                }

                const auto p = medianOf3(x, lo, lo + (hi - lo) / 2, hi - 1, less);
                const auto r = partition3(x, lo, hi, p, less);

                if (k < r.first)
                {
                    hi = r.first;
                }
                else if (k >= r.second)
                {
                    lo = r.second;
                }
                else
                {
                    return;
                }
            }
        }

        // Ranks rs[a, b) are sorted, unique and inside [lo, hi)
        template <typename S, typename C> void selectManyRange(S &x,
                                                               Index lo,
                                                               Index hi,
                                                               const std::vector<Index> &rs,
                                                               Index a,
                                                               Index b,
                                                               C less)
        {
            while (a < b)
            {
                if (b - a == 1)
                {
                    selectRange(x, lo, hi, rs[a], less);
                    return;
                }
                else if (hi - lo <= SmallRange)
                {
                    insertionSort(x, lo, hi, less);
                    return;
                }

                const auto p = medianOf3(x, lo, lo + (hi - lo) / 2, hi - 1, less);
                const auto r = partition3(x, lo, hi, p, less);

                const auto m1 = std::lower_bound(rs.begin() + a, rs.begin() + b, r.first)  - rs.begin();
                const auto m2 = std::lower_bound(rs.begin() + a, rs.begin() + b, r.second) - rs.begin();

                // Ranks in [m1, m2) fall on the pivot's run and are already in place
                selectManyRange(x, lo, r.first, rs, a, static_cast<Index>(m1), less);

                lo = r.second;
                a  = static_cast<Index>(m2);
            }
        }

        template <typename S> void checkRank(const S &x, Index k)
        {
            if (k >= length(x))
            {
                throw std::out_of_range((boost::format("Rank %1% out of range for %2% elements") % k % length(x)).str());
            }
        }
    }

    /*
     * Rearranges x in place so that x[k] holds the k-th smallest value (zero-indexed) under less.
     * Everything before k is <= x[k] and everything after is >= x[k]. Returns x[k].
     */

    template <typename S, typename C> ValueOf<S> selectNth(S &x, Index k, C less)
    {
        if (!length(x))
        {
            throw EmptyInputError("selection");
        }

        Internal::checkRank(x, k);
        Internal::selectRange(x, 0, length(x), k, less);
        return x[k];
    }

    template <typename S> ValueOf<S> selectNth(S &x, Index k)
    {
        return selectNth(x, k, TotalLess<ValueOf<S>>());
    }

    /*
     * Same as selectNth but for several ranks at once, sharing the partitioning work between
     * them. Ranks may come in any order and repeat; the values are returned in that order.
     */

    template <typename S, typename C> std::vector<ValueOf<S>> selectMany(S &x, const std::vector<Index> &ranks, C less)
    {
        std::vector<ValueOf<S>> r;

        if (ranks.empty())
        {
            return r;
        }
        else if (!length(x))
        {
            throw EmptyInputError("selection");
        }

        for (const auto &k : ranks)
        {
            Internal::checkRank(x, k);
        }

        auto rs = ranks;
        std::sort(rs.begin(), rs.end());
        rs.erase(std::unique(rs.begin(), rs.end()), rs.end());

        Internal::selectManyRange(x, 0, length(x), rs, 0, rs.size(), less);

        for (const auto &k : ranks)
        {
            r.push_back(x[k]);
        }

        return r;
    }

    template <typename S> std::vector<ValueOf<S>> selectMany(S &x, const std::vector<Index> &ranks)
    {
        return selectMany(x, ranks, TotalLess<ValueOf<S>>());
    }
}

#endif
