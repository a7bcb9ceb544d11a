#include "stats/matrix.hpp"

using namespace NDStats;

std::vector<double> MatrixTools::toSTDVect(const Vector &v)
{
    std::vector<double> r;
    r.resize(v.size());

    if (v.size())
    {
        Vector::Map(&r[0], v.size()) = v;
    }

    return r;
}

Matrix MatrixTools::fromColumns(const std::vector<std::vector<Real>> &cols)
{
    const auto nrows = cols.empty() ? 0 : cols.front().size();
    Matrix x(nrows, cols.size());

    for (auto j = 0u; j < cols.size(); j++)
    {
        if (cols[j].size() != nrows)
        {
            throw DimensionMismatchError(nrows, cols[j].size());
        }

        for (auto i = 0u; i < nrows; i++)
        {
            x(i, j) = cols[j][i];
        }
    }

    return x;
}

Matrix NDStats::cov(const Matrix &x, Real ddof)
{
    const auto n = x.cols();

    if (!n)
    {
        throw EmptyInputError("covariance needs at least one observation");
    }
    else if (ddof >= n)
    {
        throw std::invalid_argument((boost::format("ddof (%1%) must be less than the number of observations (%2%)") % ddof % n).str());
    }

    // Centre each variable on its mean
    const Matrix c = x.colwise() - x.rowwise().mean();

    return (c * c.transpose()) / (n - ddof);
}

Matrix NDStats::pearson(const Matrix &x)
{
    const auto n = x.cols();

    if (!n)
    {
        throw EmptyInputError("correlation needs at least one observation");
    }

    // ddof cancels between covariance and standard deviations
    const Matrix  c = cov(x, 0.0);
    const Vector sd = c.diagonal().array().sqrt();

    return c.array() / (sd * sd.transpose()).array();
}
