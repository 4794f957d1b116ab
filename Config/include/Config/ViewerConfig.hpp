#pragma once

#include <WindowCursor/WindowCursor.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace watchannotator::config
{
    // Malformed YAML, a wrongly typed value, or a configuration file that cannot be written.
    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct ViewerConfig
    {
        nav::WindowSettings sensors{500, 10, 10};
        nav::WindowSettings gps{50, 5, 5};

        // Half-width of the time range scanned for label/note summaries.
        std::chrono::seconds searchHorizon{300};
        std::size_t labelLines = 7;
        std::size_t noteLines = 5;

        // Single-character shortcuts to label values.
        std::map<char, std::string> keyBindings;

        [[nodiscard]] std::optional<std::string> labelForKey(char key) const
        {
            auto it = keyBindings.find(key);
            if (it == keyBindings.end())
                return std::nullopt;
            return it->second;
        }

        bool operator==(const ViewerConfig &) const = default;
    };
} // namespace watchannotator::config
