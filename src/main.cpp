#include <map>
#include <cmath>
#include <memory>
#include <iterator>
#include <iostream>
#include <algorithm>
#include <functional>
#include <unistd.h>
#include <getopt.h>
#include <string.h>

#include "stats/stats.hpp"
#include "tools/tools.hpp"
#include "data/options.hpp"
#include "hist/histogram.hpp"
#include "stats/quantile.hpp"
#include "parsers/parser_tsv.hpp"
#include "writers/file_writer.hpp"
#include "writers/terminal_writer.hpp"

using namespace NDStats;

typedef int Option;

typedef std::string Value;

static std::string version() { return "0.3.0"; }

/*
 * Options specified in the command line
 */

#define OPT_TOOL   320
#define OPT_PATH   325
#define OPT_INPUT  801
#define OPT_COLS   802
#define OPT_QS     803
#define OPT_METHOD 804
#define OPT_NAN    805
#define OPT_RULE   806

enum class Tool
{
    Quantile,
    Hist,
    Summary,
};

static std::map<Value, Tool> _tools =
{
    { "quantile", Tool::Quantile },
    { "hist",     Tool::Hist     },
    { "summary",  Tool::Summary  },
};

struct Parsing
{
    // Output directory, empty for the terminal
    Path path;

    std::map<Option, std::string> opts;

    // How ndstats is invoked
    std::string cmd;

    Tool tool;
};

// Wrap the variables so that it'll be easier to reset them
static Parsing _p;

struct InvalidToolError : public InvalidValueException
{
    InvalidToolError(const std::string &v) : InvalidValueException("tool", v) {}
};

static const char *short_opts = ":";

static const struct option long_opts[] =
{
    { "i",     required_argument, 0, OPT_INPUT },
    { "input", required_argument, 0, OPT_INPUT },

    { "c",    required_argument, 0, OPT_COLS },
    { "cols", required_argument, 0, OPT_COLS },

    { "q",         required_argument, 0, OPT_QS },
    { "quantiles", required_argument, 0, OPT_QS },

    { "m",      required_argument, 0, OPT_METHOD },
    { "method", required_argument, 0, OPT_METHOD },

    { "nan", required_argument, 0, OPT_NAN },

    { "r",    required_argument, 0, OPT_RULE },
    { "rule", required_argument, 0, OPT_RULE },

    { "o",      required_argument, 0, OPT_PATH },
    { "output", required_argument, 0, OPT_PATH },

    {0, 0, 0, 0 }
};

static void printUsage()
{
    std::cout << std::endl
              << "ndstats " << version() << std::endl << std::endl
              << "Usage: ndstats <tool> -i <file.tsv> -c <col1,col2,...> [options]" << std::endl << std::endl
              << "Tools:" << std::endl
              << "   quantile   Quantiles of each column" << std::endl
              << "   hist       Histogram over the selected columns" << std::endl
              << "   summary    Summary statistics of each column" << std::endl << std::endl
              << "Options:" << std::endl
              << "   -q, --quantiles   Comma separated quantiles (default 0,0.25,0.5,0.75,1)" << std::endl
              << "   -m, --method      lower, higher, nearest, midpoint or linear (default)" << std::endl
              << "   --nan             greatest (default), skip or fail" << std::endl
              << "   -r, --rule        sturges (default), rice, sqrt, scott, fd or auto" << std::endl
              << "   -o, --output      Output directory (default: terminal)" << std::endl
              << std::endl;
}

static Interpolation parseMethod(const Value &x)
{
    static const std::map<Value, Interpolation> m =
    {
        { "lower",    Interpolation::Lower    },
        { "higher",   Interpolation::Higher   },
        { "nearest",  Interpolation::Nearest  },
        { "midpoint", Interpolation::Midpoint },
        { "linear",   Interpolation::Linear   },
    };

    if (!m.count(x)) { throw InvalidValueException("-m", x); }
    return m.at(x);
}

static NaNPolicy parseNaN(const Value &x)
{
    if      (x == "greatest") { return NaNPolicy::Greatest; }
    else if (x == "skip")     { return NaNPolicy::Skip;     }
    else if (x == "fail")     { return NaNPolicy::Fail;     }

    throw InvalidValueException("--nan", x);
}

static BinRule parseRule(const Value &x)
{
    static const std::map<Value, BinRule> m =
    {
        { "sturges", BinRule::Sturges          },
        { "rice",    BinRule::Rice             },
        { "sqrt",    BinRule::Sqrt             },
        { "scott",   BinRule::Scott            },
        { "fd",      BinRule::FreedmanDiaconis },
        { "auto",    BinRule::Auto             },
    };

    if (!m.count(x)) { throw InvalidValueException("-r", x); }
    return m.at(x);
}

static std::vector<Real> withoutNaN(const std::vector<Real> &x)
{
    std::vector<Real> r;
    std::copy_if(x.begin(), x.end(), std::back_inserter(r), [&](Real i) { return !std::isnan(i); });
    return r;
}

static void writeQuantile(const StatsOptions &o)
{
    const auto cols = ParserTSV::read(o.file, o.cols);

    Toks head { "Column" };
    for (const auto &q : o.qs) { head.push_back("Q" + toString(q, 4, true)); }

    o.writer->write(join(head, "\t"));

    for (auto i = 0u; i < cols.size(); i++)
    {
        auto x = cols[i];
        const auto r = quantilesMut(x, o.qs, o.method, o.nan);

        Toks toks { o.cols[i] };
        for (const auto &v : r) { toks.push_back(S6(v)); }

        o.writer->write(join(toks, "\t"));
    }
}

static void writeSummary(const StatsOptions &o)
{
    const auto cols = ParserTSV::read(o.file, o.cols);

    o.writer->write("Column\tN\tNaN\tMean\tSD\tMin\tQ25\tMedian\tQ75\tMax");

    for (auto i = 0u; i < cols.size(); i++)
    {
        auto x = withoutNaN(cols[i]);
        const auto nNaN = cols[i].size() - x.size();

        if (x.empty())
        {
            o.warn("No values in " + o.cols[i]);
            continue;
        }

        const auto q = quantilesMut(x, std::vector<Real> { 0.0, 0.25, 0.5, 0.75, 1.0 }, o.method);

        o.writer->write((boost::format("%1%\t%2%\t%3%\t%4%\t%5%\t%6%\t%7%\t%8%\t%9%\t%10%") % o.cols[i]
                                                                                          % x.size()
                                                                                          % nNaN
                                                                                          % S6(mean(x))
                                                                                          % (x.size() >= 2 ? S6(SD(x, 1.0)) : MISSING)
                                                                                          % S6(q[0])
                                                                                          % S6(q[1])
                                                                                          % S6(q[2])
                                                                                          % S6(q[3])
                                                                                          % S6(q[4])).str());
    }
}

static void writeHist(const StatsOptions &o)
{
    const auto cols = ParserTSV::read(o.file, o.cols);

    std::vector<Edges> es;

    for (auto i = 0u; i < cols.size(); i++)
    {
        es.push_back(edges(withoutNaN(cols[i]), o.rule));
        o.logInfo((boost::format("%1%: %2% bins (%3%)") % o.cols[i] % es.back().bins() % toString(o.rule)).str());
    }

    const Grid grid(es);
    const auto h = histogram(MatrixTools::fromColumns(cols), grid);
    const auto shape = h.counts().shape();

    Toks head;
    for (const auto &c : o.cols) { head.push_back(c + "_Lower"); head.push_back(c + "_Upper"); }
    head.push_back("Count");

    o.writer->write(join(head, "\t"));

    for (Index i = 0; i < h.counts().size(); i++)
    {
        // Row-major flat index to bin coordinate
        BinCoord c(shape.size());

        for (auto d = shape.size(), r = i; d-- > 0;)
        {
            c[d] = r % shape[d];
            r /= shape[d];
        }

        Toks toks;

        for (const auto &range : grid.rangeOf(c))
        {
            toks.push_back(S6(range.first));
            toks.push_back(S6(range.second));
        }

        toks.push_back(std::to_string(h.counts()[i]));
        o.writer->write(join(toks, "\t"));
    }

    if (h.outOfRange())
    {
        o.warn((boost::format("%1% rows outside the grid were not binned") % h.outOfRange()).str());
    }
}

static void start(StatsOptions &o)
{
    const auto path = _p.path;

    o.output = std::make_shared<TerminalWriter>(true);

    if (!path.empty())
    {
        auto logger = std::make_shared<FileWriter>(path);
        logger->open("ndstats.log");
        o.logger = logger;

        o.writer = std::make_shared<FileWriter>(path);
    }
    else
    {
        o.writer = std::make_shared<TerminalWriter>();
    }

    o.cmd = _p.cmd;
    o.work = path;
    o.version = version();

    o.logInfo("Version: " + version());
    o.logInfo(o.cmd);
    o.logInfo(date());

    if (!_p.opts.count(OPT_INPUT)) { throw MissingOptionException("-i"); }
    if (!_p.opts.count(OPT_COLS))  { throw MissingOptionException("-c"); }

    o.file = _p.opts.at(OPT_INPUT);
    split(_p.opts.at(OPT_COLS), ",", o.cols);

    o.qs = _p.opts.count(OPT_QS) ? toReals(_p.opts.at(OPT_QS)) : std::vector<Real> { 0.0, 0.25, 0.5, 0.75, 1.0 };

    if (_p.opts.count(OPT_METHOD)) { o.method = parseMethod(_p.opts.at(OPT_METHOD)); }
    if (_p.opts.count(OPT_NAN))    { o.nan = parseNaN(_p.opts.at(OPT_NAN)); }
    if (_p.opts.count(OPT_RULE))   { o.rule = parseRule(_p.opts.at(OPT_RULE)); }

    auto run = [&](const FileName &file, std::function<void ()> f)
    {
        if (!path.empty())
        {
            o.writer->open(file);
            o.generate(file);
        }

        logRun(f, o, "Analyzing: " + o.file, "Completed");

        o.writer->close();
    };

    switch (_p.tool)
    {
        case Tool::Quantile: { run("ndstats_quantile.tsv", [&]() { writeQuantile(o); });     break; }
        case Tool::Summary:  { run("ndstats_summary.tsv",  [&]() { writeSummary(o); });      break; }
        case Tool::Hist:     { run("ndstats_hist.tsv",     [&]() { writeHist(o); });         break; }
    }
}

void parse(int argc, char ** argv)
{
    _p = Parsing();

    if ((argc <= 1) || (!strcmp(argv[1], "-h") || !strcmp(argv[1], "--help")))
    {
        printUsage();
        return;
    }
    else if (!strcmp(argv[1], "-v"))
    {
        std::cout << version() << std::endl;
        return;
    }
    else if (!_tools.count(argv[1]))
    {
        throw InvalidToolError(argv[1]);
    }

    _p.tool = _tools[argv[1]];

    for (auto i = 0; i < argc; i++)
    {
        _p.cmd += std::string(argv[i]) + " ";
    }

    // The tool name takes the place of the program name
    auto args = argv + 1;

    // Full reset of getopt, required for unit-testing
    optind = 0;

    int next, index;

    while ((next = getopt_long_only(argc - 1, args, short_opts, long_opts, &index)) != -1)
    {
        if (next < OPT_TOOL)
        {
            throw InvalidOptionException(args[optind - 1]);
        }

        switch (next)
        {
            case OPT_PATH: { _p.path = optarg; break; }
            default:       { _p.opts[next] = optarg; break; }
        }
    }

    StatsOptions o;
    start(o);
}

extern int parse_options(int argc, char ** argv)
{
    auto printError = [&](const std::string &x)
    {
        std::cerr << "***********************" << std::endl;
        std::cerr << "[ERRO]: " << x << std::endl;
        std::cerr << "***********************" << std::endl << std::endl;
    };

    try
    {
        parse(argc, argv);
        return 0;
    }
    catch (const InvalidToolError &ex)
    {
        printError("Invalid command. Unknown tool: " + ex.val + ". Please check your usage and try again.");
    }
    catch (const InvalidOptionException &ex)
    {
        printError((boost::format("Invalid usage. Unknown option: %1%") % ex.opt).str());
    }
    catch (const InvalidValueException &ex)
    {
        printError((boost::format("Invalid command. %1% not expected for %2%.") % ex.val % ex.opt).str());
    }
    catch (const MissingOptionException &ex)
    {
        printError((boost::format("Invalid command. Mandatory option is missing. Please specify %1%.") % ex.opt).str());
    }
    catch (const InvalidFileError &ex)
    {
        printError((boost::format("%1%%2%") % "Invalid command. File is invalid: " % ex.file).str());
    }
    catch (const EmptyInputError &ex)
    {
        printError(ex.what());
    }
    catch (const InvalidQuantileError &ex)
    {
        printError(ex.what());
    }
    catch (const DegenerateSampleError &ex)
    {
        printError(std::string(ex.what()) + ". Try another column or rule.");
    }
    catch (const UndefinedOrderError &ex)
    {
        printError(std::string(ex.what()) + ". Use --nan skip to ignore missing values.");
    }
    catch (const std::exception &ex)
    {
        printError(ex.what());
    }

    return 1;
}

#ifndef UNIT_TEST
int main(int argc, char ** argv)
{
    return parse_options(argc, argv);
}
#endif
