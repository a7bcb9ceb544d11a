#ifndef PARSER_TSV_HPP
#define PARSER_TSV_HPP

#include <vector>
#include "stats/matrix.hpp"

namespace NDStats
{
    /*
     * Reads numeric columns from a tab separated file whose first row is a header. Missing
     * values ("NA", "-", "." or empty) are read as NaN.
     */

    struct ParserTSV
    {
        typedef std::vector<std::vector<Real>> Columns;

        // Columns in the order requested; throws if a column doesn't exist or isn't numeric
        static Columns read(const FileName &, const std::vector<Column> &);

        // Same as read() but as a matrix, one column per requested column
        static Matrix readMatrix(const FileName &, const std::vector<Column> &);

        static bool isMissing(const Token &);
    };
}

#endif
