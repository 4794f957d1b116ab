#pragma once

#include <Config/ViewerConfig.hpp>
#include <string>

namespace watchannotator::config
{
    /// YAML persistence of ViewerConfig. Keys missing from a document keep their defaults.
    class ConfigStore
    {
    public:
        /// A file that does not exist yields the defaults; anything unreadable throws ConfigError.
        static ViewerConfig load(const std::string &path);
        static void save(const ViewerConfig &config, const std::string &path);

        static ViewerConfig fromYaml(const std::string &text);
        static std::string toYaml(const ViewerConfig &config);
    };
} // namespace watchannotator::config
