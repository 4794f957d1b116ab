#include <Config/ConfigStore.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>

namespace watchannotator::config
{
    namespace
    {
        std::size_t readCount(const YAML::Node &node, const std::string &key, std::size_t fallback)
        {
            if (!node[key])
                return fallback;

            const auto value = node[key].as<long long>();
            if (value < 0)
                throw ConfigError("'" + key + "' must not be negative, got " + std::to_string(value));
            return static_cast<std::size_t>(value);
        }

        nav::WindowSettings readWindow(const YAML::Node &node, const std::string &section, nav::WindowSettings settings)
        {
            const YAML::Node window = node[section];
            if (!window)
                return settings;
            if (!window.IsMap())
                throw ConfigError("'" + section + "' must be a map");

            settings.length = readCount(window, "window_size", settings.length);
            settings.resizeStep = readCount(window, "resize_step", settings.resizeStep);
            settings.navigateStep = readCount(window, "navigate_step", settings.navigateStep);
            return settings;
        }

        void emitWindow(YAML::Emitter &out, const std::string &section, const nav::WindowSettings &settings)
        {
            out << YAML::Key << section << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "window_size" << YAML::Value << settings.length;
            out << YAML::Key << "resize_step" << YAML::Value << settings.resizeStep;
            out << YAML::Key << "navigate_step" << YAML::Value << settings.navigateStep;
            out << YAML::EndMap;
        }

        ViewerConfig fromNode(const YAML::Node &root)
        {
            ViewerConfig config;
            if (!root || root.IsNull())
                return config;
            if (!root.IsMap())
                throw ConfigError("configuration root must be a map");

            config.sensors = readWindow(root, "sensors", config.sensors);
            config.gps = readWindow(root, "gps", config.gps);

            const auto horizon = readCount(root, "search_horizon_seconds", static_cast<std::size_t>(config.searchHorizon.count()));
            config.searchHorizon = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(horizon));
            config.labelLines = readCount(root, "label_lines", config.labelLines);
            config.noteLines = readCount(root, "note_lines", config.noteLines);

            if (const YAML::Node bindings = root["key_bindings"])
            {
                if (!bindings.IsMap())
                    throw ConfigError("'key_bindings' must be a map");

                for (const auto &entry : bindings)
                {
                    const auto key = entry.first.as<std::string>();
                    if (key.size() != 1)
                        throw ConfigError("key binding '" + key + "' must be a single character");
                    config.keyBindings[key.front()] = entry.second.as<std::string>();
                }
            }
            return config;
        }
    } // namespace

    ViewerConfig ConfigStore::fromYaml(const std::string &text)
    {
        try
        {
            return fromNode(YAML::Load(text));
        }
        catch (const YAML::Exception &e)
        {
            throw ConfigError(std::string("invalid configuration: ") + e.what());
        }
    }

    ViewerConfig ConfigStore::load(const std::string &path)
    {
        if (!std::filesystem::exists(path))
            return ViewerConfig{};

        try
        {
            return fromNode(YAML::LoadFile(path));
        }
        catch (const YAML::Exception &e)
        {
            throw ConfigError("invalid configuration in " + path + ": " + e.what());
        }
    }

    std::string ConfigStore::toYaml(const ViewerConfig &config)
    {
        YAML::Emitter out;
        out << YAML::BeginMap;

        emitWindow(out, "sensors", config.sensors);
        emitWindow(out, "gps", config.gps);

        out << YAML::Key << "search_horizon_seconds" << YAML::Value << config.searchHorizon.count();
        out << YAML::Key << "label_lines" << YAML::Value << config.labelLines;
        out << YAML::Key << "note_lines" << YAML::Value << config.noteLines;

        out << YAML::Key << "key_bindings" << YAML::Value << YAML::BeginMap;
        for (const auto &[key, label] : config.keyBindings)
            out << YAML::Key << std::string(1, key) << YAML::Value << label;
        out << YAML::EndMap;

        out << YAML::EndMap;
        return out.c_str();
    }

    void ConfigStore::save(const ViewerConfig &config, const std::string &path)
    {
        std::ofstream fout(path, std::ios::out | std::ios::trunc);
        if (!fout.is_open())
            throw ConfigError("cannot open " + path + " for writing");

        fout << toYaml(config) << "\n";
        if (!fout)
            throw ConfigError("failed writing " + path);
    }
} // namespace watchannotator::config
