#include <marksite/MarkdownRenderer.hpp>
#include <marksite/PageTemplate.hpp>
#include <marksite/SiteGenerator.hpp>
#include <marksite/Utilities.hpp>
#include <trantor/utils/Logger.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

using namespace marksite;
namespace fs = std::filesystem;

static const std::string_view usage = "Usage: md2html [-v] FILE.md [OUTPUT.html]";

int main(int argc, char** argv)
{
    int argi = 1;
    if(argi < argc && std::string_view(argv[argi]) == "-v") {
        trantor::Logger::setLogLevel(trantor::Logger::LogLevel::kTrace);
        argi++;
    }
    if(argi >= argc || argc - argi > 2 || std::string_view(argv[argi]) == "-h"
        || std::string_view(argv[argi]) == "--help") {
        std::cerr << usage << std::endl;
        return 1;
    }

    fs::path in_path = argv[argi];
    fs::path out_path = argi + 1 < argc ? fs::path(argv[argi + 1]) : fs::path(in_path).replace_extension(".html");

    try {
        auto doc = renderDocument(utils::readFile(in_path));
        utils::writeFile(out_path, PageTemplate().render(doc, titleFromStem(in_path.stem().string())));
    }
    catch(const std::exception& e) {
        LOG_ERROR << e.what();
        return 2;
    }
    LOG_INFO << "Wrote " << out_path.string();
    return 0;
}
