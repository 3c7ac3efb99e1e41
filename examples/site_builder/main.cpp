#include <marksite/SiteConfig.hpp>
#include <marksite/SiteGenerator.hpp>
#include <trantor/utils/Logger.h>

#include <exception>
#include <iostream>
#include <utility>

using namespace marksite;

int main(int argc, char** argv)
{
    if(argc != 2) {
        std::cerr << "Usage: site_builder CONFIG.json" << std::endl;
        return 1;
    }

    try {
        auto config = SiteConfig::fromFile(argv[1]);
        trantor::Logger::setLogLevel(config.log_level);
        SiteGenerator generator(std::move(config));
        auto summary = generator.generate();
        LOG_INFO << "Site ready: " << summary.homepages << " homepages, " << summary.articles << " articles";
    }
    catch(const std::exception& e) {
        LOG_ERROR << e.what();
        return 2;
    }
    return 0;
}
