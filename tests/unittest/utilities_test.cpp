#include <drogon/drogon_test.h>
#include <marksite/Utilities.hpp>

#include <filesystem>
#include <random>
#include <stdexcept>

using namespace marksite;
namespace fs = std::filesystem;

DROGON_TEST(ReadWriteFile)
{
    auto dir = fs::temp_directory_path() / ("marksite_utils_" + std::to_string(std::random_device{}()));
    fs::create_directories(dir);

    const std::string content = std::string("line one\r\nline two\n") + '\0' + "tail";
    utils::writeFile(dir / "a.md", content);
    CHECK(utils::readFile(dir / "a.md") == content);

    // Existing files are truncated
    utils::writeFile(dir / "a.md", "short");
    CHECK(utils::readFile(dir / "a.md") == "short");

    utils::writeFile(dir / "empty.md", "");
    CHECK(utils::readFile(dir / "empty.md") == "");

    CHECK_THROWS_AS(utils::readFile(dir / "missing.md"), std::runtime_error);
    CHECK_THROWS_AS(utils::writeFile(dir / "no_such_dir" / "b.md", "x"), std::runtime_error);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
