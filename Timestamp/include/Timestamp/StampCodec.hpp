#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace watchannotator::time
{
    /// Sample timestamps as stored in the data files: wall-clock time with microsecond resolution.
    using Stamp = std::chrono::sys_time<std::chrono::microseconds>;

    /// Text form used by the data files: "YYYY-MM-DD HH:MM:SS.ffffff".
    class StampCodec
    {
    public:
        /// Accepts 1-6 fraction digits (or none). Returns std::nullopt on malformed input.
        [[nodiscard]] static std::optional<Stamp> parse(std::string_view text) noexcept;

        /// Always writes six fraction digits.
        [[nodiscard]] static std::string format(Stamp stamp);

        [[nodiscard]] static double secondsBetween(Stamp from, Stamp to) noexcept;
    };
} // namespace watchannotator::time
