#ifdef UNIT_TEST

#include <cmath>
#include <catch2/catch.hpp>
#include "parsers/parser_tsv.hpp"
#include "writers/file_writer.hpp"

using namespace NDStats;

static const FileName TSV = "/tmp/ndstats_parser.tsv";

TEST_CASE("ParserTSV_1")
{
    FileWriter::create("/tmp", "ndstats_parser.tsv", "Name\tA\tB\nx\t1.5\tNA\ny\t2\t3\nz\t-1\t.");

    const auto r = ParserTSV::read(TSV, std::vector<Column> { "B", "A" });

    REQUIRE(r.size() == 2);
    REQUIRE(r[1] == std::vector<Real> { 1.5, 2.0, -1.0 });
    REQUIRE(std::isnan(r[0][0]));
    REQUIRE(r[0][1] == 3.0);
    REQUIRE(std::isnan(r[0][2]));

    const auto m = ParserTSV::readMatrix(TSV, std::vector<Column> { "A" });

    REQUIRE(m.rows() == 3);
    REQUIRE(m.cols() == 1);
    REQUIRE(m(2, 0) == -1.0);
}

TEST_CASE("ParserTSV_2")
{
    FileWriter::create("/tmp", "ndstats_parser.tsv", "A\tB\n1\tx\n");

    REQUIRE_THROWS_AS(ParserTSV::read(TSV, std::vector<Column> { "B" }), InvalidValueException);
    REQUIRE_THROWS_AS(ParserTSV::read(TSV, std::vector<Column> { "C" }), std::runtime_error);
    REQUIRE_THROWS_AS(ParserTSV::read("/tmp/ndstats_none.tsv", std::vector<Column> { "A" }), InvalidFileError);
}

TEST_CASE("ParserTSV_3")
{
    REQUIRE(ParserTSV::isMissing(""));
    REQUIRE(ParserTSV::isMissing("NA"));
    REQUIRE(ParserTSV::isMissing(" - "));
    REQUIRE(!ParserTSV::isMissing("0"));
}

#endif
