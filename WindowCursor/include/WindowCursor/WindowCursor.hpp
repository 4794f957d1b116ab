#pragma once

#include <cstddef>

namespace watchannotator::nav
{
    struct WindowSettings
    {
        std::size_t length = 500;
        std::size_t resizeStep = 10;
        std::size_t navigateStep = 10;

        bool operator==(const WindowSettings &) const = default;
    };

    // How far stepForward() may push the window end.
    enum class ForwardBound
    {
        Inclusive, // start + length + step <= size
        Exclusive  // start + length + step <  size
    };

    // What gotoFraction() scales.
    enum class SeekBase
    {
        FitWindow, // fraction of (size - length)
        RawIndex   // fraction of size, clamped so the window still fits
    };

    struct CursorPolicy
    {
        ForwardBound forwardBound{ForwardBound::Inclusive};
        SeekBase seekBase{SeekBase::FitWindow};

        static CursorPolicy sensor() noexcept { return {ForwardBound::Inclusive, SeekBase::FitWindow}; }
        static CursorPolicy gps() noexcept { return {ForwardBound::Exclusive, SeekBase::RawIndex}; }
    };

    enum class CursorState
    {
        Empty,
        Active
    };

    /// Movable, resizable window [start, start + length) over a sequence of `size` items.
    /// Every operation returns whether it changed the window; requests that would leave the
    /// sequence bounds are rejected instead of clamped.
    class WindowCursor
    {
    public:
        explicit WindowCursor(CursorPolicy policy, WindowSettings requested = {});

        /// Back to Empty. The requested settings are kept for the next activate().
        void reset() noexcept;

        /// Empty -> Active over a sequence of `size` items, window at the start.
        /// A zero size leaves the cursor Empty and returns false.
        bool activate(std::size_t size) noexcept;

        /// Stores `requested` and returns the settings actually in effect: window length capped at
        /// the sequence size, step rates capped at half of it when the sequence is shorter than the
        /// step. While Empty only the minimum length of one is enforced.
        WindowSettings applyWindowSizePolicy(const WindowSettings &requested) noexcept;

        bool stepForward() noexcept;
        bool stepBackward() noexcept;
        bool growWindow() noexcept;
        bool shrinkWindow() noexcept;
        bool gotoFraction(double fraction) noexcept;

        [[nodiscard]] CursorState state() const noexcept { return m_state; }
        [[nodiscard]] bool isActive() const noexcept { return m_state == CursorState::Active; }
        [[nodiscard]] std::size_t startIndex() const noexcept { return m_start; }
        [[nodiscard]] std::size_t length() const noexcept { return m_settings.length; }
        [[nodiscard]] std::size_t lastIndex() const noexcept { return m_start + m_settings.length - 1; }
        [[nodiscard]] std::size_t size() const noexcept { return m_size; }
        [[nodiscard]] const WindowSettings &settings() const noexcept { return m_settings; }
        [[nodiscard]] const WindowSettings &requestedSettings() const noexcept { return m_requested; }
        [[nodiscard]] const CursorPolicy &policy() const noexcept { return m_policy; }

        [[nodiscard]] bool contains(std::size_t index) const noexcept;

    private:
        CursorPolicy m_policy;
        WindowSettings m_requested;
        WindowSettings m_settings;
        CursorState m_state{CursorState::Empty};
        std::size_t m_size{0};
        std::size_t m_start{0};
    };
} // namespace watchannotator::nav
