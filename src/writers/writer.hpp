#ifndef WRITER_HPP
#define WRITER_HPP

#include "data/data.hpp"

namespace NDStats
{
    /*
     * Sink for reports and log messages
     */

    template <typename T = std::string> struct Writer
    {
        virtual ~Writer() {}

        virtual void close() = 0;
        virtual void open(const FileName &) = 0;
        virtual void write(const T &, bool newLine = true) = 0;
    };

    // Discards everything, used when no output is wanted
    struct MockWriter : public Writer<>
    {
        inline void close() override {}
        inline void open(const FileName &) override {}
        inline void write(const std::string &, bool newLine = true) override {}
    };
}

#endif
