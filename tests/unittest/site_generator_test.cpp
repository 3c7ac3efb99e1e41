#include <drogon/drogon_test.h>
#include <marksite/SiteGenerator.hpp>
#include <marksite/Utilities.hpp>

#include <filesystem>
#include <random>
#include <stdexcept>

using namespace marksite;
namespace fs = std::filesystem;

static fs::path makeTempDir(const std::string& prefix)
{
    auto dir = fs::temp_directory_path() / (prefix + std::to_string(std::random_device{}()));
    fs::create_directories(dir);
    return dir;
}

static SiteConfig configFor(const fs::path& root)
{
    Json::Value json;
    json["source_root"] = root.string();
    return SiteConfig::fromJson(json);
}

DROGON_TEST(TitleFromStem)
{
    CHECK(titleFromStem("pipe_example") == "Pipe Example");
    CHECK(titleFromStem("hello-world") == "Hello-World");
    CHECK(titleFromStem("ALL_CAPS2go") == "All Caps2Go");
    CHECK(titleFromStem("") == "");
}

DROGON_TEST(SiteGenerator)
{
    auto root = makeTempDir("marksite_site_");
    fs::create_directories(root / "docs");
    fs::create_directories(root / "notes");
    fs::create_directories(root / ".hidden");
    utils::writeFile(root / "README.md", "# Root\nWelcome\n");
    utils::writeFile(root / "pipe_example.md", "Pipe body with $x$\n");
    utils::writeFile(root / "docs" / "README.md", "# Docs\n");
    utils::writeFile(root / "docs" / "guide.md", "---\ntitle: g\n---\nGuide body\n");
    utils::writeFile(root / "notes" / "loose.md", "not linked\n");
    utils::writeFile(root / ".hidden" / "README.md", "# Hidden\n");

    SiteGenerator generator(configFor(root));
    CHECK(generator.isValidHomepage(root));
    CHECK(generator.isValidHomepage(root / "notes") == false);
    CHECK(generator.findArticles(root) == std::vector<std::string>{"pipe_example.md"});
    CHECK(generator.findChildHomepages(root) == std::vector<std::string>{"docs"});

    auto summary = generator.generate();
    CHECK(summary.homepages == 2);
    CHECK(summary.articles == 2);

    auto out = root / "example_output";
    REQUIRE(fs::is_regular_file(out / "index.html"));
    REQUIRE(fs::is_regular_file(out / "pipe_example.html"));
    REQUIRE(fs::is_regular_file(out / "docs" / "index.html"));
    REQUIRE(fs::is_regular_file(out / "docs" / "guide.html"));
    CHECK(fs::exists(out / "notes") == false);
    CHECK(fs::exists(out / ".hidden") == false);

    auto index = utils::readFile(out / "index.html");
    CHECK(index.find("<title>Root</title>") != std::string::npos);
    CHECK(index.find("<p>Welcome</p>") != std::string::npos);
    auto docs_link = index.find("<a href=\"docs/index.html\">docs</a>");
    auto pipe_link = index.find("<a href=\"pipe_example.html\">pipe_example</a>");
    REQUIRE(docs_link != std::string::npos);
    REQUIRE(pipe_link != std::string::npos);
    CHECK(docs_link < pipe_link);
    CHECK(index.find("MathJax") == std::string::npos);

    auto pipe = utils::readFile(out / "pipe_example.html");
    CHECK(pipe.find("<title>Pipe Example</title>") != std::string::npos);
    CHECK(pipe.find("MathJax") != std::string::npos);

    auto guide = utils::readFile(out / "docs" / "guide.html");
    CHECK(guide.find("<p>Guide body</p>") != std::string::npos);
    CHECK(guide.find("title: g") == std::string::npos);

    auto docs = utils::readFile(out / "docs" / "index.html");
    CHECK(docs.find("<a href=\"guide.html\">guide</a>") != std::string::npos);

    // The output directory of a previous run is never picked up as content
    CHECK(generator.generate().homepages == 2);
    fs::remove_all(root);
}

DROGON_TEST(SiteGeneratorRequiresHomepageRoot)
{
    auto root = makeTempDir("marksite_empty_");
    SiteGenerator generator(configFor(root));
    CHECK_THROWS_AS(generator.generate(), std::runtime_error);
    fs::remove_all(root);
}
