#include <WindowCursor/WindowCursor.hpp>
#include <algorithm>
#include <cmath>

namespace watchannotator::nav
{
    WindowCursor::WindowCursor(CursorPolicy policy, WindowSettings requested) : m_policy(policy)
    {
        applyWindowSizePolicy(requested);
    }

    void WindowCursor::reset() noexcept
    {
        m_state = CursorState::Empty;
        m_size = 0;
        m_start = 0;
        applyWindowSizePolicy(m_requested);
    }

    bool WindowCursor::activate(std::size_t size) noexcept
    {
        if (size == 0)
        {
            reset();
            return false;
        }

        m_state = CursorState::Active;
        m_size = size;
        m_start = 0;
        applyWindowSizePolicy(m_requested);
        return true;
    }

    WindowSettings WindowCursor::applyWindowSizePolicy(const WindowSettings &requested) noexcept
    {
        m_requested = requested;

        WindowSettings effective = requested;
        effective.length = std::max<std::size_t>(effective.length, 1);

        if (isActive())
        {
            if (m_size < effective.length)
                effective.length = m_size;
            if (m_size < effective.resizeStep)
                effective.resizeStep = m_size / 2;
            if (m_size < effective.navigateStep)
                effective.navigateStep = m_size / 2;

            if (m_start + effective.length > m_size)
                m_start = m_size - effective.length;
        }

        m_settings = effective;
        return m_settings;
    }

    bool WindowCursor::stepForward() noexcept
    {
        const std::size_t step = m_settings.navigateStep;
        if (!isActive() || step == 0)
            return false;

        const std::size_t end = m_start + m_settings.length + step;
        const bool fits = m_policy.forwardBound == ForwardBound::Inclusive ? end <= m_size : end < m_size;
        if (!fits)
            return false;

        m_start += step;
        return true;
    }

    bool WindowCursor::stepBackward() noexcept
    {
        const std::size_t step = m_settings.navigateStep;
        if (!isActive() || step == 0 || step > m_start)
            return false;

        m_start -= step;
        return true;
    }

    bool WindowCursor::growWindow() noexcept
    {
        const std::size_t step = m_settings.resizeStep;
        if (!isActive() || step == 0)
            return false;

        if (m_start + m_settings.length + step > m_size)
            return false;

        m_settings.length += step;
        return true;
    }

    bool WindowCursor::shrinkWindow() noexcept
    {
        const std::size_t step = m_settings.resizeStep;
        if (!isActive() || step == 0 || m_settings.length <= step)
            return false;

        m_settings.length -= step;
        return true;
    }

    bool WindowCursor::gotoFraction(double fraction) noexcept
    {
        // also rejects NaN
        if (!isActive() || !(fraction >= 0.0 && fraction <= 1.0))
            return false;

        const std::size_t room = m_size - m_settings.length;
        if (m_policy.seekBase == SeekBase::FitWindow)
        {
            m_start = static_cast<std::size_t>(std::floor(fraction * static_cast<double>(room)));
        }
        else
        {
            const auto raw = static_cast<std::size_t>(std::floor(fraction * static_cast<double>(m_size)));
            m_start = std::min(raw, room);
        }
        return true;
    }

    bool WindowCursor::contains(std::size_t index) const noexcept
    {
        return isActive() && index >= m_start && index < m_start + m_settings.length;
    }
} // namespace watchannotator::nav
