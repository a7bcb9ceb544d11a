#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>
#include <stdexcept>
#include <boost/format.hpp>

namespace NDStats
{
    #define ND_CHECK(cond, message) \
    if (!(cond)) { throw std::runtime_error(message); }

    #define ND_THROW(message) \
    throw std::runtime_error(message);

    /*
     * Base class for errors caused by the data rather than by the caller's code
     */

    struct StatsError : public std::runtime_error
    {
        StatsError(const std::string &msg) : std::runtime_error(msg) {}
    };

    // Zero-length data where a statistic needs at least one element
    struct EmptyInputError : public StatsError
    {
        EmptyInputError(const std::string &what) : StatsError("Empty input: " + what) {}
    };

    struct InvalidQuantileError : public StatsError
    {
        InvalidQuantileError(double q) : StatsError((boost::format("Invalid quantile: %1%. Must be in [0,1].") % q).str()), q(q) {}

        const double q;
    };

    // Zero-range (or otherwise unusable) sample where a positive bin width is required
    struct DegenerateSampleError : public StatsError
    {
        DegenerateSampleError(const std::string &msg) : StatsError("Degenerate sample: " + msg) {}
    };

    struct DimensionMismatchError : public StatsError
    {
        DimensionMismatchError(std::size_t expected, std::size_t actual)
            : StatsError((boost::format("Dimension mismatch: expected %1%, got %2%") % expected % actual).str()),
              expected(expected), actual(actual) {}

        const std::size_t expected, actual;
    };

    // NaN found where a total order is required
    struct UndefinedOrderError : public StatsError
    {
        UndefinedOrderError(const std::string &what) : StatsError("Undefined order (NaN) in " + what) {}
    };

    struct InvalidOptionException : public std::runtime_error
    {
        InvalidOptionException(const std::string &opt) : std::runtime_error("Invalid option: " + opt), opt(opt) {}

        const std::string opt;
    };

    struct InvalidValueException : public std::runtime_error
    {
        InvalidValueException(const std::string &opt, const std::string &val)
            : std::runtime_error("Invalid value \"" + val + "\" for " + opt), opt(opt), val(val) {}

        const std::string opt, val;
    };

    struct MissingOptionException : public std::runtime_error
    {
        MissingOptionException(const std::string &opt) : std::runtime_error("Missing option: " + opt), opt(opt) {}

        const std::string opt;
    };

    struct InvalidFileError : public std::runtime_error
    {
        InvalidFileError(const std::string &file) : std::runtime_error("Invalid file: " + file), file(file) {}

        const std::string file;
    };
}

#endif
