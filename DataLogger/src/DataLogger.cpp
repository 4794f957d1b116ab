#include <DataLogger/DataLogger.hpp>
#include <iostream>

namespace watchannotator::logging
{
    DataLogger::DataLogger(const LoggerConfig &config, bus::CommunicationBus &bus) : m_config(config), m_bus(bus) {}

    void DataLogger::start()
    {
        if (m_running)
            return;

        m_file.open(m_config.outputPath, std::ios::out | std::ios::trunc);
        if (!m_file.is_open())
        {
            std::cerr << "[DataLogger] cannot open " << m_config.outputPath << "\n";
            return;
        }

        m_running = true;

        if (m_config.logProgress)
            m_bus.subscribe([this](const ProgressUpdate &p)
                            { this->handleProgress(p); });

        if (m_config.logCompletions)
            m_bus.subscribe([this](const TaskCompleted &c)
                            { this->handleCompletion(c); });

        if (m_config.logSystemEvents)
            m_bus.subscribe([this](const SystemEvent &e)
                            { this->handleSystemEvent(e); });
    }

    void DataLogger::stop()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;
        m_running = false;

        if (m_file.is_open())
            m_file.close();
    }

    std::string DataLogger::flatten(const std::string &text)
    {
        std::string out;
        out.reserve(text.size());
        for (char c : text)
        {
            if (c == '\n')
                out += " | ";
            else
                out += c;
        }
        return out;
    }

    void DataLogger::handleProgress(const ProgressUpdate &p)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;
        m_file << "[Progress] task=" << toString(p.task)
               << " msg=" << flatten(p.message)
               << "\n";
    }

    void DataLogger::handleCompletion(const TaskCompleted &c)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;
        m_file << "[TaskCompleted] task=" << toString(c.task)
               << " success=" << c.success;
        if (!c.error.empty())
            m_file << " error=" << flatten(c.error);
        m_file << "\n";
    }

    void DataLogger::handleSystemEvent(const SystemEvent &e)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;
        m_file << "[SystemEvent] type=" << toString(e.type)
               << " desc=" << e.description
               << "\n";
    }

} // namespace watchannotator::logging
