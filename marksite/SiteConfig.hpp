#pragma once

#include <json/value.h>
#include <trantor/utils/Logger.h>

#include <filesystem>
#include <string>

namespace marksite
{

/**
 * @brief Settings of a whole site build. Loaded from a JSON file such as
 * {
 *     "source_root": "vault",
 *     "output_dir": "site",
 *     "template": "index.html",
 *     "homepage_file": "README.md",
 *     "log_level": "INFO"
 * }
 * Only source_root is required. Relative paths are resolved against the
 * directory holding the config file.
 */
struct SiteConfig
{
    std::filesystem::path source_root;
    // Defaults to <source_root>/example_output
    std::filesystem::path output_dir;
    // Empty: use the built-in page template
    std::filesystem::path template_path;
    std::string homepage_file = "README.md";
    trantor::Logger::LogLevel log_level = trantor::Logger::LogLevel::kInfo;

    static SiteConfig fromJson(const Json::Value& config, const std::filesystem::path& base_dir = {});
    static SiteConfig fromFile(const std::string& path);
};

// TRACE, DEBUG, INFO, WARN or ERROR in any case. Throws std::runtime_error otherwise
trantor::Logger::LogLevel parseLogLevel(const std::string& name);

}
