#include "LinkEmbedder.hpp"
#include <drogon/HttpViewData.h>

#include <stdexcept>

using namespace drogon;
using namespace marksite;

static void validateIdentifier(const std::string& name, const std::string_view kind)
{
    if(name.empty() || name == "." || name == ".." || name.find_first_of("/\\") != std::string::npos)
        throw std::invalid_argument("Invalid " + std::string(kind) + " identifier: \"" + name + "\"");
}

static std::string link(const std::string& href, const std::string& text)
{
    return "<li><a href=\"" + HttpViewData::htmlTranslate(href) + "\">"
        + HttpViewData::htmlTranslate(text) + "</a></li>\n";
}

std::string marksite::embedLinks(const std::string_view body,
    const std::vector<std::string>& homepage_dirs,
    const std::vector<std::string>& singleton_articles)
{
    for(const auto& dir : homepage_dirs)
        validateIdentifier(dir, "homepage");
    for(const auto& article : singleton_articles)
        validateIdentifier(article, "article");

    std::string res(body);
    if(homepage_dirs.empty() && singleton_articles.empty())
        return res;

    res += "<hr>\n";
    if(!homepage_dirs.empty()) {
        res += "<ul class=\"homepages\">\n";
        for(const auto& dir : homepage_dirs)
            res += link(dir + "/index.html", dir);
        res += "</ul>\n";
    }
    if(!singleton_articles.empty()) {
        res += "<ul class=\"articles\">\n";
        for(const auto& article : singleton_articles) {
            std::string name = article;
            if(name.size() > 3 && name.compare(name.size() - 3, 3, ".md") == 0)
                name.resize(name.size() - 3);
            res += link(name + ".html", name);
        }
        res += "</ul>\n";
    }
    return res;
}
