#include "PageTemplate.hpp"
#include "Utilities.hpp"
#include <drogon/HttpViewData.h>
#include <drogon/utils/Utilities.h>
#include <trantor/utils/Logger.h>

#include <stdexcept>

using namespace drogon;
using namespace marksite;

static const std::string placement = "<div id=\"placement\"></div>";
static const std::string titleMarker = "__MARKSITE_TITLE__";
static const std::string mathMarker = "__MARKSITE_MATH_SCRIPTS__";

static const std::string_view mathScripts = R"zz(<script src="https://polyfill.io/v3/polyfill.min.js?features=es6"></script>
<script id="MathJax-script" async src="https://cdn.jsdelivr.net/npm/mathjax@3/es5/tex-mml-chtml.js"></script>
)zz";

static const std::string_view defaultTemplate = R"zz(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>__MARKSITE_TITLE__</title>
__MARKSITE_MATH_SCRIPTS__<style>
body{font-family:system-ui,Helvetica,Arial,sans-serif;line-height:1.4;max-width:72ch;margin:2rem auto;padding:0 1rem}
h1,h2,h3,h4,h5,h6{margin:1.1em 0 0.6em}
img{max-width:100%}
.code-block{position:relative;background:#f5f5f5;border:1px solid #ddd;padding:0.75rem 0.5rem;margin:1em 0}
.code-block pre{margin:0;overflow-x:auto}
.code-block button.copy{position:absolute;top:0.3rem;right:0.3rem;border:none;background:#eaeaea;padding:0.2rem 0.5rem;cursor:pointer}
.code-block button.copy:active{background:#d5d5d5}
</style>
<script>
function copyCode(btn){
    const code = document.getElementById(btn.dataset.target);
    navigator.clipboard.writeText(code.innerText).then(function(){
        const orig = btn.textContent;
        btn.textContent = 'Copied!';
        setTimeout(function(){btn.textContent = orig;}, 1000);
    });
}
</script>
</head>
<body>
<div id="placement"></div>
</body>
</html>
)zz";

PageTemplate::PageTemplate()
    : source_(defaultTemplate)
{
}

PageTemplate::PageTemplate(std::string source)
    : source_(std::move(source))
{
    if(source_.find(placement) == std::string::npos)
        throw std::runtime_error("Page template has no " + placement + " element");
}

PageTemplate PageTemplate::fromFile(const std::string& path)
{
    std::string source = marksite::utils::readFile(path);
    LOG_DEBUG << "Loaded page template " << path;
    try {
        return PageTemplate(std::move(source));
    }
    catch(const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

std::string PageTemplate::render(const RenderedDocument& doc, const std::string& fallback_title) const
{
    const std::string title = doc.title.empty() ? HttpViewData::htmlTranslate(fallback_title) : doc.title;
    return render(doc.body, title, doc.has_math);
}

std::string PageTemplate::render(const std::string& body, const std::string& title, bool has_math) const
{
    std::string html = source_;
    const std::string scripts = has_math ? std::string(mathScripts) : "";
    if(html.find(mathMarker) != std::string::npos)
        utils::replaceAll(html, mathMarker, scripts);
    else if(has_math) {
        auto head_end = html.find("</head>");
        if(head_end != std::string::npos)
            html.insert(head_end, scripts);
    }
    utils::replaceAll(html, titleMarker, title);

    // The body goes in last so markers inside the document are left alone
    auto pos = html.find(placement);
    html.replace(pos, placement.size(), "<div id=\"placement\">" + body + "</div>");
    return html;
}
