#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <memory>
#include "data/data.hpp"
#include "hist/strategies.hpp"
#include "writers/writer.hpp"

namespace NDStats
{
    /*
     * Where a tool sends its report (writer), its log (logger) and its progress messages (output)
     */

    class WriterOptions
    {
        public:

            WriterOptions() : showWarn(true),
                              showGen(true),
                              writer(std::make_shared<MockWriter>()),
                              logger(std::make_shared<MockWriter>()),
                              output(std::make_shared<MockWriter>()) {}

            // Working directory
            Path work;

            bool showWarn, showGen;

            std::shared_ptr<Writer<>> writer, logger, output;

            inline void wait(const std::string &s) const
            {
                log("[WAIT]: " + s);
                out("[WAIT]: " + s);
            }

            inline void warn(const std::string &s) const
            {
                if (showWarn)
                {
                    log("[WARN]: " + s);
                    out("[WARN]: " + s);
                }
            }

            inline void logWarn(const std::string &s) const
            {
                if (showWarn)
                {
                    log("[WARN]: " + s);
                }
            }

            inline void generate(const FileName &f) const
            {
                if (showGen) { info("Generating " + f); }
            }

            inline void info(const std::string &s) const
            {
                log("[INFO]: " + s);
                out("[INFO]: " + s);
            }

            inline void logInfo(const std::string &s) const
            {
                log("[INFO]: " + s);
            }

            inline void error(const std::string &s) const
            {
                log("[ERROR]: " + s);
                out("[ERROR]: " + s);
            }

        private:

            inline void out(const std::string &s) const { if (output) { output->write(s); } }
            inline void log(const std::string &s) const { if (logger) { logger->write(s); } }
    };

    /*
     * Options shared by the statistics tools
     */

    struct StatsOptions : public WriterOptions
    {
        StatsOptions() : method(Interpolation::Linear), nan(NaNPolicy::Greatest), rule(BinRule::Sturges) {}

        // Input file (tab separated, with a header)
        FileName file;

        // Columns to analyse
        std::vector<Column> cols;

        // Quantiles to report
        std::vector<Real> qs;

        Interpolation method;

        NaNPolicy nan;

        // How the histogram bins are estimated
        BinRule rule;

        // Full command
        std::string cmd;

        std::string version;
    };
}

#endif
