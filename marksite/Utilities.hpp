#pragma once

#include <filesystem>
#include <string>

namespace marksite
{
namespace utils
{

/**
 * @brief Read a whole file.
 * @throws std::runtime_error if the file cannot be opened.
 */
std::string readFile(const std::filesystem::path& path);

/**
 * @brief Create or truncate path and write content to it.
 * @throws std::runtime_error if the file cannot be opened or written.
 */
void writeFile(const std::filesystem::path& path, const std::string& content);

}
}
