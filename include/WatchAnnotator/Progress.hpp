#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>

namespace watchannotator
{
    // Caller-supplied hooks for long-running load/merge/save work. Both are optional and are
    // invoked on the thread running the operation.
    struct ProgressCallbacks
    {
        std::function<void(const std::string &)> onProgress;
        std::function<void()> onComplete;

        void progress(const std::string &message) const
        {
            if (onProgress)
                onProgress(message);
        }

        void complete() const
        {
            if (onComplete)
                onComplete();
        }
    };

    /// "12.3" for 123 of 1000, truncated to one decimal.
    inline std::string formatPercent(std::size_t part, std::size_t whole)
    {
        const double percent = whole == 0 ? 0.0 : std::floor(1000.0 * static_cast<double>(part) / static_cast<double>(whole)) / 10.0;
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << percent;
        return oss.str();
    }
} // namespace watchannotator
