#include <ctime>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include "tools/tools.hpp"

using namespace NDStats;

void NDStats::createD(const Path &x)
{
    if (!exists(x) && mkdir(x.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH))
    {
        throw InvalidFileError(x);
    }
}

bool NDStats::exists(const FileName &file)
{
    struct stat buffer;
    return (stat(file.c_str(), &buffer) == 0);
}

std::string NDStats::readFile(const FileName &file)
{
    std::ifstream x(file);

    if (!x.good())
    {
        throw InvalidFileError(file);
    }

    return std::string((std::istreambuf_iterator<char>(x)), std::istreambuf_iterator<char>());
}

std::string NDStats::date()
{
    time_t rawtime;
    struct tm * timeinfo;
    char buffer[80];

    time (&rawtime);
    timeinfo = localtime(&rawtime);

    strftime(buffer, 80, "%d-%m-%Y %H:%M:%S", timeinfo);
    std::string str(buffer);

    return str;
}

std::vector<Real> NDStats::toReals(const Token &x)
{
    Toks toks;
    split(x, ",", toks);

    std::vector<Real> r;

    for (const auto &t : toks)
    {
        try
        {
            r.push_back(std::stod(trim(t)));
        }
        catch (const std::logic_error &)
        {
            throw InvalidValueException("number list", x);
        }
    }

    return r;
}
