#ifndef TOOLS_HPP
#define TOOLS_HPP

#include <cmath>
#include <chrono>
#include <vector>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include "data/data.hpp"
#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace NDStats
{
    typedef std::vector<Token> Toks;

    // Printed for NaN and infinite values
    const std::string MISSING = "NA";

    void createD(const Path &);

    bool exists(const FileName &);

    std::string readFile(const FileName &);

    std::string date();

    template <typename T> static void split(const Token &x, const Token &d, T &r)
    {
        r.clear();
        boost::split(r, x, boost::is_any_of(d));
    }

    inline Token join(const Toks &x, const std::string &d)
    {
        return boost::algorithm::join(x, d);
    }

    inline Token trim(const Token &x)
    {
        return boost::algorithm::trim_copy(x);
    }

    inline bool isEnd(const std::string &x, const std::string &y)
    {
        return boost::algorithm::ends_with(x, y);
    }

    inline bool isBegin(const std::string &x, const std::string &y)
    {
        return boost::algorithm::starts_with(x, y);
    }

    inline bool isSubstr(const std::string &x, const std::string &y)
    {
        return x.find(y) != std::string::npos;
    }

    template <typename T> std::string toString(const T &x, unsigned n = 2, bool naTrailZero = false)
    {
        if (std::isnan(x) || !std::isfinite(x))
        {
            return MISSING;
        }

        std::ostringstream out;
        out << std::fixed << std::setprecision(n) << x;

        auto str = out.str();

        if (isEnd(str, "0") && isSubstr(str, ".") && naTrailZero)
        {
            int offset{1};
            if (str.find_last_not_of('0') == str.find('.')) { offset = 0; }
            str.erase(str.find_last_not_of('0') + offset, std::string::npos);
        }

        return str;
    }

    #define S2(x) toString(x,2)
    #define S4(x) toString(x,4)
    #define S6(x) toString(x,6)

    // Parses a comma separated list of numbers, eg: "0.25,0.5,0.75"
    std::vector<Real> toReals(const Token &);

    /*
     * Runs f between two log messages and logs how long it took
     */

    template <typename F, typename O> void logRun(F f,
                                                  const O &o,
                                                  const std::string &s1,
                                                  const std::string &s2)
    {
        o.logInfo(s1);
        using namespace std::chrono;
        auto t1 = high_resolution_clock::now();
        f();
        auto t2 = high_resolution_clock::now();
        o.logInfo(s2);
        o.logInfo((boost::format("%1% milliseconds") % duration_cast<milliseconds>(t2 - t1).count()).str());
    }
}

#endif
