#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace watchannotator
{
    enum class TaskKind
    {
        Load,
        Merge,
        Save
    };

    enum class ViewMode
    {
        Sensors,
        Gps
    };

    // Human-readable progress of a long-running load/merge/save.
    struct ProgressUpdate
    {
        std::chrono::steady_clock::time_point timestamp;
        TaskKind task{TaskKind::Load};
        std::string message;
    };

    // Emitted once when a task finishes, successfully or not.
    struct TaskCompleted
    {
        std::chrono::steady_clock::time_point timestamp;
        TaskKind task{TaskKind::Load};
        bool success{true};
        std::string error;
    };

    enum class SystemEventType
    {
        DataLoaded,
        DataSaved,
        ModeChanged,
        ConfigApplied,
        NoChanges
    };

    // Represents high-level session events for logging.
    struct SystemEvent
    {
        std::chrono::steady_clock::time_point timestamp;
        SystemEventType type{SystemEventType::DataLoaded};
        std::string description;
    };

    // Snapshot of the active layer's window, handed to whatever draws it.
    struct WindowView
    {
        std::chrono::steady_clock::time_point timestamp;
        ViewMode mode{ViewMode::Sensors};
        std::size_t start_index{0};
        std::size_t length{0};
        std::size_t size{0};

        // Sensor rows covered by the window (for GPS, the rows its runs span).
        std::size_t first_row{0};
        std::size_t last_row{0};

        std::string first_stamp;
        std::string last_stamp;

        // Runs (GPS) or rows (sensors) in the window flagged invalid.
        std::size_t invalid_count{0};
    };

    inline const char *toString(TaskKind task)
    {
        switch (task)
        {
        case TaskKind::Load:
            return "Load";
        case TaskKind::Merge:
            return "Merge";
        case TaskKind::Save:
            return "Save";
        }
        return "Unknown";
    }

    inline const char *toString(ViewMode mode)
    {
        switch (mode)
        {
        case ViewMode::Sensors:
            return "Sensors";
        case ViewMode::Gps:
            return "Gps";
        }
        return "Unknown";
    }

    inline const char *toString(SystemEventType type)
    {
        switch (type)
        {
        case SystemEventType::DataLoaded:
            return "DataLoaded";
        case SystemEventType::DataSaved:
            return "DataSaved";
        case SystemEventType::ModeChanged:
            return "ModeChanged";
        case SystemEventType::ConfigApplied:
            return "ConfigApplied";
        case SystemEventType::NoChanges:
            return "NoChanges";
        }
        return "Unknown";
    }
} // namespace watchannotator
