#include "SiteConfig.hpp"
#include <json/reader.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

using namespace marksite;
namespace fs = std::filesystem;

static fs::path resolve(const fs::path& base_dir, const std::string& path)
{
    fs::path p(path);
    if(p.is_relative() && !base_dir.empty())
        return base_dir / p;
    return p;
}

trantor::Logger::LogLevel marksite::parseLogLevel(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
    if(upper == "TRACE")
        return trantor::Logger::LogLevel::kTrace;
    if(upper == "DEBUG")
        return trantor::Logger::LogLevel::kDebug;
    if(upper == "INFO")
        return trantor::Logger::LogLevel::kInfo;
    if(upper == "WARN")
        return trantor::Logger::LogLevel::kWarn;
    if(upper == "ERROR")
        return trantor::Logger::LogLevel::kError;
    throw std::runtime_error("Unknown log level: " + name);
}

SiteConfig SiteConfig::fromJson(const Json::Value& config, const fs::path& base_dir)
{
    if(!config.isObject())
        throw std::runtime_error("Site config must be a JSON object");

    SiteConfig cfg;
    auto source_root = config.get("source_root", "").asString();
    if(source_root.empty())
        throw std::runtime_error("source_root not specified");
    cfg.source_root = resolve(base_dir, source_root);

    auto output_dir = config.get("output_dir", "").asString();
    cfg.output_dir = output_dir.empty() ? cfg.source_root / "example_output" : resolve(base_dir, output_dir);

    auto template_path = config.get("template", "").asString();
    if(!template_path.empty())
        cfg.template_path = resolve(base_dir, template_path);

    cfg.homepage_file = config.get("homepage_file", "README.md").asString();
    if(cfg.homepage_file.empty() || cfg.homepage_file.find_first_of("/\\") != std::string::npos)
        throw std::runtime_error("homepage_file must be a plain file name, got \"" + cfg.homepage_file + "\"");

    cfg.log_level = parseLogLevel(config.get("log_level", "INFO").asString());
    return cfg;
}

SiteConfig SiteConfig::fromFile(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if(!in)
        throw std::runtime_error("Cannot open config file " + path);

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    if(!Json::parseFromStream(builder, in, &root, &errs))
        throw std::runtime_error("Failed to parse " + path + ": " + errs);

    try {
        return fromJson(root, fs::path(path).parent_path());
    }
    catch(const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}
