#include "Utilities.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace marksite
{
namespace utils
{

std::string readFile(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if(!in)
        throw std::runtime_error("Cannot read " + path.string());
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void writeFile(const fs::path& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if(!out)
        throw std::runtime_error("Cannot open " + path.string() + " for writing");
    out << content;
    out.close();
    if(!out)
        throw std::runtime_error("Failed to write " + path.string());
}

}
}
