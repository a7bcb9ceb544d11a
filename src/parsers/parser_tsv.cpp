#include <limits>
#include <fstream>
#include <algorithm>
#include <rapidcsv.h>
#include "tools/tools.hpp"
#include "parsers/parser_tsv.hpp"

using namespace NDStats;

bool ParserTSV::isMissing(const Token &x)
{
    const auto t = trim(x);
    return t.empty() || t == MISSING || t == "." || t == "-";
}

ParserTSV::Columns ParserTSV::read(const FileName &file, const std::vector<Column> &cols)
{
    if (!std::ifstream(file).good())
    {
        throw InvalidFileError(file);
    }

    rapidcsv::Document doc(file, rapidcsv::LabelParams(0, -1), rapidcsv::SeparatorParams('\t'));
    const auto heads = doc.GetColumnNames();

    Columns r;

    for (const auto &c : cols)
    {
        ND_CHECK(std::find(heads.begin(), heads.end(), c) != heads.end(), "Column not found in " + file + ": " + c);

        std::vector<Real> x;

        for (const auto &t : doc.GetColumn<std::string>(c))
        {
            if (isMissing(t))
            {
                x.push_back(std::numeric_limits<Real>::quiet_NaN());
                continue;
            }

            try
            {
                x.push_back(std::stod(t));
            }
            catch (const std::logic_error &)
            {
                throw InvalidValueException("column " + c, t);
            }
        }

        r.push_back(x);
    }

    return r;
}

Matrix ParserTSV::readMatrix(const FileName &file, const std::vector<Column> &cols)
{
    return MatrixTools::fromColumns(read(file, cols));
}
