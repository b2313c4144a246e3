#include "photnorm/RawFile.hpp"
#include "photnorm/TextUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace photnorm {

bool RawFile::has_fits_signature() const
{
    return content.compare(0, 9, "SIMPLE  =") == 0;
}

bool RawFile::looks_binary() const
{
    return content.find('\0') != std::string::npos;
}

RawFile read_raw_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");

    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad())
        throw std::runtime_error("Error while reading '" + path + "'");

    return make_raw_file(buf.str(), path);
}

RawFile make_raw_file(std::string content, std::string path)
{
    RawFile f;
    f.extension = to_lower(fs::path(path).extension().string());
    f.path      = std::move(path);
    f.content   = std::move(content);
    return f;
}

} // namespace photnorm
