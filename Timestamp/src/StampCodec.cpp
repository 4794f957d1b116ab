#include <Timestamp/StampCodec.hpp>
#include <iomanip>
#include <sstream>

namespace watchannotator::time
{
    namespace
    {
        bool isDigit(char c) noexcept
        {
            return c >= '0' && c <= '9';
        }

        bool readNumber(std::string_view text, std::size_t &pos, std::size_t digits, int &out) noexcept
        {
            if (pos + digits > text.size())
                return false;

            int value = 0;
            for (std::size_t i = 0; i < digits; ++i)
            {
                const char c = text[pos + i];
                if (!isDigit(c))
                    return false;
                value = value * 10 + (c - '0');
            }

            pos += digits;
            out = value;
            return true;
        }

        bool expect(std::string_view text, std::size_t &pos, char c) noexcept
        {
            if (pos >= text.size() || text[pos] != c)
                return false;
            ++pos;
            return true;
        }
    } // namespace

    std::optional<Stamp> StampCodec::parse(std::string_view text) noexcept
    {
        std::size_t pos = 0;
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

        const bool ok = readNumber(text, pos, 4, year) && expect(text, pos, '-') &&
                        readNumber(text, pos, 2, month) && expect(text, pos, '-') &&
                        readNumber(text, pos, 2, day) && expect(text, pos, ' ') &&
                        readNumber(text, pos, 2, hour) && expect(text, pos, ':') &&
                        readNumber(text, pos, 2, minute) && expect(text, pos, ':') &&
                        readNumber(text, pos, 2, second);
        if (!ok)
            return std::nullopt;

        int micros = 0;
        if (pos < text.size())
        {
            if (text[pos] != '.')
                return std::nullopt;
            ++pos;

            std::size_t digits = 0;
            while (pos < text.size() && digits < 6 && isDigit(text[pos]))
            {
                micros = micros * 10 + (text[pos] - '0');
                ++pos;
                ++digits;
            }

            if (digits == 0 || pos != text.size())
                return std::nullopt;

            for (; digits < 6; ++digits)
                micros *= 10;
        }

        const std::chrono::year_month_day ymd{std::chrono::year{year},
                                              std::chrono::month{static_cast<unsigned>(month)},
                                              std::chrono::day{static_cast<unsigned>(day)}};
        if (!ymd.ok() || hour > 23 || minute > 59 || second > 59)
            return std::nullopt;

        return Stamp{std::chrono::sys_days{ymd} + std::chrono::hours{hour} + std::chrono::minutes{minute} +
                     std::chrono::seconds{second} + std::chrono::microseconds{micros}};
    }

    std::string StampCodec::format(Stamp stamp)
    {
        const auto days = std::chrono::floor<std::chrono::days>(stamp);
        const std::chrono::year_month_day ymd{days};
        const std::chrono::hh_mm_ss<std::chrono::microseconds> tod{stamp - days};

        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(4) << static_cast<int>(ymd.year()) << '-'
            << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
            << std::setw(2) << static_cast<unsigned>(ymd.day()) << ' '
            << std::setw(2) << tod.hours().count() << ':'
            << std::setw(2) << tod.minutes().count() << ':'
            << std::setw(2) << tod.seconds().count() << '.'
            << std::setw(6) << tod.subseconds().count();
        return oss.str();
    }

    double StampCodec::secondsBetween(Stamp from, Stamp to) noexcept
    {
        return std::chrono::duration<double>(to - from).count();
    }
} // namespace watchannotator::time
