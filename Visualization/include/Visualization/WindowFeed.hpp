#pragma once

#include <CommunicationBus/CommunicationBus.hpp>
#include <Visualization/JsonSerializer.hpp>
#include <atomic>
#include <mutex>
#include <ostream>

namespace watchannotator::viz
{
    // Bridges window snapshots to a renderer: subscribes on the CommunicationBus and writes one
    // JSON line per WindowView to the given stream.
    class WindowFeed
    {
    public:
        WindowFeed(bus::CommunicationBus &bus, std::ostream &out);

        void start();
        void stop();

        [[nodiscard]] std::size_t linesWritten() const noexcept { return m_lines.load(); }

    private:
        void handleWindowView(const WindowView &v);

        bus::CommunicationBus &m_bus;
        std::ostream &m_out;

        std::atomic<bool> m_running{false};
        std::atomic<std::size_t> m_lines{0};
        std::mutex m_mutex;
    };
} // namespace watchannotator::viz
