#pragma once
#include <WatchAnnotator/Messages.hpp>
#include <string>
#include <string_view>

namespace watchannotator::viz
{
    // One JSON object per message, always on a single line.
    struct JsonSerializer
    {
        static std::string toJson(const WindowView &v);
        static std::string toJson(const ProgressUpdate &p);
        static std::string toJson(const TaskCompleted &c);
        static std::string toJson(const SystemEvent &e);

        static std::string quote(std::string_view text);
    };
} // namespace watchannotator::viz
