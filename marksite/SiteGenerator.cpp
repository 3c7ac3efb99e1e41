#include "SiteGenerator.hpp"
#include "LinkEmbedder.hpp"
#include "MarkdownRenderer.hpp"
#include "Utilities.hpp"
#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace marksite;
namespace fs = std::filesystem;

static bool iequals(const std::string_view a, const std::string_view b)
{
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

static PageTemplate loadTemplate(const SiteConfig& config)
{
    if(config.template_path.empty())
        return PageTemplate();
    return PageTemplate::fromFile(config.template_path.string());
}

std::string marksite::titleFromStem(const std::string_view stem)
{
    std::string res;
    bool word_start = true;
    for(char ch : stem) {
        if(ch == '_')
            ch = ' ';
        unsigned char c = static_cast<unsigned char>(ch);
        if(std::isalpha(c)) {
            res += static_cast<char>(word_start ? std::toupper(c) : std::tolower(c));
            word_start = false;
        }
        else {
            res += ch;
            word_start = true;
        }
    }
    return res;
}

SiteGenerator::SiteGenerator(SiteConfig config)
    : SiteGenerator(config, loadTemplate(config))
{
}

SiteGenerator::SiteGenerator(SiteConfig config, PageTemplate page_template)
    : config_(std::move(config))
    , template_(std::move(page_template))
{
}

bool SiteGenerator::isValidHomepage(const fs::path& dir) const
{
    std::error_code ec;
    return fs::is_directory(dir, ec) && fs::is_regular_file(dir / config_.homepage_file, ec);
}

std::vector<std::string> SiteGenerator::findArticles(const fs::path& dir) const
{
    std::vector<std::string> articles;
    for(const auto& entry : fs::directory_iterator(dir)) {
        if(!entry.is_regular_file() || entry.path().extension() != ".md")
            continue;
        auto name = entry.path().filename().string();
        if(iequals(name, config_.homepage_file))
            continue;
        articles.push_back(std::move(name));
    }
    std::sort(articles.begin(), articles.end());
    return articles;
}

std::vector<std::string> SiteGenerator::findChildHomepages(const fs::path& dir) const
{
    std::vector<std::string> dirs;
    for(const auto& entry : fs::directory_iterator(dir)) {
        auto name = entry.path().filename().string();
        if(!entry.is_directory() || entry.is_symlink() || name.empty() || name[0] == '.')
            continue;
        std::error_code ec;
        if(!canonical_output_.empty() && fs::weakly_canonical(entry.path(), ec) == canonical_output_) {
            LOG_DEBUG << "Skipping output directory " << entry.path().string();
            continue;
        }
        if(!isValidHomepage(entry.path())) {
            LOG_DEBUG << "Skipping " << entry.path().string() << ", it has no " << config_.homepage_file;
            continue;
        }
        dirs.push_back(std::move(name));
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

fs::path SiteGenerator::outputDirFor(const fs::path& dir) const
{
    auto rel = fs::relative(dir, config_.source_root);
    if(rel.empty() || rel == ".")
        return config_.output_dir;
    return config_.output_dir / rel;
}

SiteSummary SiteGenerator::generate()
{
    if(!isValidHomepage(config_.source_root))
        throw std::runtime_error(config_.source_root.string() + " is not a homepage directory, it has no "
            + config_.homepage_file);

    canonical_output_ = fs::weakly_canonical(config_.output_dir);
    LOG_INFO << "Generating site from " << config_.source_root.string() << " into " << config_.output_dir.string();

    SiteSummary summary;
    generateHomepage(config_.source_root, summary);
    LOG_INFO << "Wrote " << summary.homepages << " homepages and " << summary.articles << " articles";
    return summary;
}

void SiteGenerator::generateHomepage(const fs::path& dir, SiteSummary& summary)
{
    auto articles = findArticles(dir);
    auto children = findChildHomepages(dir);

    // Children first, then this directory's articles, then the homepage itself
    for(const auto& child : children)
        generateHomepage(dir / child, summary);
    generateArticles(dir, articles, summary);

    auto doc = renderDocument(utils::readFile(dir / config_.homepage_file));
    doc.body = embedLinks(doc.body, children, articles);

    auto out_dir = outputDirFor(dir);
    fs::create_directories(out_dir);
    auto out_file = out_dir / "index.html";
    auto name = fs::weakly_canonical(dir).filename().string();
    utils::writeFile(out_file, template_.render(doc, titleFromStem(name)));
    LOG_INFO << "Wrote homepage " << out_file.string();
    summary.homepages++;
}

void SiteGenerator::generateArticles(const fs::path& dir,
    const std::vector<std::string>& articles, SiteSummary& summary)
{
    if(articles.empty())
        return;
    auto out_dir = outputDirFor(dir);
    fs::create_directories(out_dir);

    for(const auto& article : articles) {
        fs::path md_path = dir / article;
        auto doc = renderDocument(utils::readFile(md_path));
        auto out_file = out_dir / md_path.stem();
        out_file += ".html";
        utils::writeFile(out_file, template_.render(doc, titleFromStem(md_path.stem().string())));
        LOG_INFO << "Wrote article " << out_file.string();
        summary.articles++;
    }
}
