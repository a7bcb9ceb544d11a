#ifndef TERMINAL_WRITER_HPP
#define TERMINAL_WRITER_HPP

#include <iostream>
#include "writers/writer.hpp"

namespace NDStats
{
    class TerminalWriter : public Writer<>
    {
        public:

            TerminalWriter(bool err = false) : _err(err) {}

            inline void close() override {}

            inline void open(const FileName &) override {}

            inline void write(const std::string &str, bool newLine = true) override
            {
                auto &o = _err ? std::cerr : std::cout;

                o << str;
                if (newLine) { o << std::endl; }
            }

        private:

            // Write to standard error instead of standard output?
            bool _err;
    };
}

#endif
