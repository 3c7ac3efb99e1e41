#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <trantor/utils/NonCopyable.h>

#include "PageTemplate.hpp"
#include "SiteConfig.hpp"

namespace marksite
{

struct SiteSummary
{
    size_t homepages = 0;
    size_t articles = 0;
};

/**
 * @brief Converts a tree of Markdown documents into a static site.
 *
 * Every directory holding the homepage file (README.md) is a homepage. Its
 * other *.md files are singleton articles and its homepage subdirectories are
 * child homepages. A homepage is written as <output>/<relative dir>/index.html
 * and links to its children and articles, an article is written beside it as
 * <stem>.html.
 */
class SiteGenerator : public trantor::NonCopyable
{
public:
    // Loads the page template named by the config, or uses the built-in one
    explicit SiteGenerator(SiteConfig config);
    SiteGenerator(SiteConfig config, PageTemplate page_template);

    /**
     * @brief Generate the whole site.
     * @throws std::runtime_error if the source root is not a homepage or a
     * file cannot be read or written.
     */
    SiteSummary generate();

    bool isValidHomepage(const std::filesystem::path& dir) const;
    // Sorted names of the singleton articles in dir, with their .md extension
    std::vector<std::string> findArticles(const std::filesystem::path& dir) const;
    // Sorted names of the homepage subdirectories of dir
    std::vector<std::string> findChildHomepages(const std::filesystem::path& dir) const;

protected:
    void generateHomepage(const std::filesystem::path& dir, SiteSummary& summary);
    void generateArticles(const std::filesystem::path& dir,
        const std::vector<std::string>& articles, SiteSummary& summary);
    std::filesystem::path outputDirFor(const std::filesystem::path& dir) const;

    SiteConfig config_;
    PageTemplate template_;
    std::filesystem::path canonical_output_;
};

/**
 * @brief Page title derived from a file or directory name:
 * "pipe_example" => "Pipe Example"
 */
std::string titleFromStem(const std::string_view stem);

}
