#include <Visualization/WindowFeed.hpp>

namespace watchannotator::viz
{
    WindowFeed::WindowFeed(bus::CommunicationBus &bus, std::ostream &out) : m_bus(bus), m_out(out) {}

    void WindowFeed::start()
    {
        bool expected = false;
        if (!m_running.compare_exchange_strong(expected, true))
            return;

        m_bus.subscribe([this](const WindowView &v)
                        { this->handleWindowView(v); });
    }

    void WindowFeed::stop()
    {
        bool wasRunning = m_running.exchange(false);
        if (!wasRunning)
            return;

        std::lock_guard<std::mutex> lock(m_mutex);
        m_out.flush();
    }

    void WindowFeed::handleWindowView(const WindowView &v)
    {
        if (!m_running)
            return;

        std::lock_guard<std::mutex> lock(m_mutex);
        m_out << JsonSerializer::toJson(v) << '\n';
        ++m_lines;
    }

} // namespace watchannotator::viz
