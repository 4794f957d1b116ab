#pragma once

#include <CommunicationBus/CommunicationBus.hpp>
#include <mutex>
#include <fstream>
#include <string>

namespace watchannotator::logging
{
    struct LoggerConfig
    {
        std::string outputPath;
        bool logProgress = true;
        bool logCompletions = true;
        bool logSystemEvents = true;
    };

    class DataLogger
    {
    public:
        DataLogger(const LoggerConfig &config,
                   bus::CommunicationBus &bus);

        // Opens the log file and subscribes; must run before the bus is started.
        void start();
        void stop();

        [[nodiscard]] bool isOpen() const { return m_file.is_open(); }

    private:
        void handleProgress(const ProgressUpdate &p);
        void handleCompletion(const TaskCompleted &c);
        void handleSystemEvent(const SystemEvent &e);

        // Progress messages span several lines; the log keeps one entry per line.
        static std::string flatten(const std::string &text);

    private:
        LoggerConfig m_config;
        bus::CommunicationBus &m_bus;

        std::ofstream m_file;
        std::mutex m_mutex;

        bool m_running = false;
    };
} // namespace watchannotator::logging
