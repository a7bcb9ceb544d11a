#ifndef STATS_MATRIX_HPP
#define STATS_MATRIX_HPP

#include <vector>
#include <Eigen/Dense>
#include "data/data.hpp"

namespace NDStats
{
    typedef Eigen::MatrixXd Matrix;
    typedef Eigen::VectorXd Vector;

    template <typename T> using MatrixOf = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;
    template <typename T> using VectorOf = Eigen::Matrix<T, Eigen::Dynamic, 1>;

    /*
     * Axis of a matrix that a reduction runs along. Rows collapses the row axis, giving one
     * result per column; Cols collapses the column axis, giving one result per row.
     */

    enum class Axis
    {
        Rows = 0,
        Cols = 1,
    };

    struct MatrixTools
    {
        static std::vector<double> toSTDVect(const Vector &v);

        // Each inner vector becomes a column; all columns must have the same length
        static Matrix fromColumns(const std::vector<std::vector<Real>> &);
    };

    /*
     * Covariance matrix between the rows of x (variables), using the columns as observations.
     * ddof is subtracted from the number of observations in the denominator.
     */

    Matrix cov(const Matrix &x, Real ddof = 1.0);

    // Pearson correlation matrix between the rows of x
    Matrix pearson(const Matrix &x);
}

#endif
