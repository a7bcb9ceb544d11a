#ifndef FILE_WRITER_HPP
#define FILE_WRITER_HPP

#include <memory>
#include <fstream>
#include "tools/tools.hpp"
#include "writers/writer.hpp"

namespace NDStats
{
    class FileWriter : public Writer<>
    {
        public:

            FileWriter(const Path &path) : path(path) {}
            ~FileWriter() { close(); }

            static void create(const Path &path, const FileName &file, const std::string &txt)
            {
                FileWriter w(path);
                w.open(file);
                w.write(txt);
                w.close();
            }

            void close() override
            {
                if (_o)
                {
                    _o->close();
                    _o.reset();
                }
            }

            void open(const FileName &file) override
            {
                if (!path.empty())
                {
                    createD(path);
                }

                const auto target = !path.empty() ? path + "/" + file : file;
                _o = std::make_shared<std::ofstream>(target);

                if (!_o->good())
                {
                    throw InvalidFileError(target);
                }
            }

            void write(const std::string &x, bool newLine = true) override
            {
                if (!_o)
                {
                    throw std::runtime_error("FileWriter: write before open");
                }

                *(_o) << x;
                if (newLine) { *(_o) << std::endl; }
            }

            std::string path;

        private:

            std::shared_ptr<std::ofstream> _o;
    };
}

#endif
