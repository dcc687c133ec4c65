#include "utils/TimeUtils.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace OpsTriage
{
    namespace Utils
    {
        // -------- Basic conversions --------

        TimePoint from_time_t(std::time_t t) noexcept
        {
            return Clock::from_time_t(t);
        }

        std::time_t to_time_t(TimePoint tp) noexcept
        {
            return Clock::to_time_t(tp);
        }

        TimePoint now() noexcept
        {
            return Clock::now();
        }

        // -------- Formatting helpers --------

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            std::time_t t = to_time_t(tp);
            std::tm tm_buf{};
        #if defined(_WIN32)
            localtime_s(&tm_buf, &t);
        #else
            localtime_r(&t, &tm_buf);
        #endif

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, std::string(format).c_str());
            return oss.str();
        }

        std::string toIso8601Utc(TimePoint tp)
        {
            std::time_t t = to_time_t(tp);
            std::tm tm_buf{};
        #if defined(_WIN32)
            gmtime_s(&tm_buf, &t);
        #else
            gmtime_r(&t, &tm_buf);
        #endif

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
            return oss.str();
        }

        // -------- Parsing helpers --------

        namespace
        {
            bool isDigit(char c) noexcept
            {
                return c >= '0' && c <= '9';
            }

            // Fixed-width decimal field; nullopt on any non-digit.
            std::optional<int> parseFixed(std::string_view sv, std::size_t pos, std::size_t width)
            {
                if (pos + width > sv.size())
                {
                    return std::nullopt;
                }
                int value = 0;
                for (std::size_t i = pos; i < pos + width; ++i)
                {
                    if (!isDigit(sv[i]))
                    {
                        return std::nullopt;
                    }
                    value = value * 10 + (sv[i] - '0');
                }
                return value;
            }

            bool isLeapYear(int year) noexcept
            {
                return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            }

            int daysInMonth(int year, int month) noexcept
            {
                static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (month == 2 && isLeapYear(year))
                {
                    return 29;
                }
                return days[month - 1];
            }

            // Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant).
            std::int64_t daysFromCivil(int y, int m, int d) noexcept
            {
                y -= m <= 2 ? 1 : 0;
                const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
                const unsigned yoe = static_cast<unsigned>(y - era * 400);
                const unsigned doy = static_cast<unsigned>((153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1);
                const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
            }

            // Half the clock's span each side of the epoch, so differences
            // between two accepted time points cannot overflow either.
            constexpr std::int64_t kMaxEpochSeconds =
                std::chrono::duration_cast<seconds>(Clock::duration::max()).count() / 2;

            std::optional<TimePoint> fromEpoch(std::int64_t epochSeconds, std::int64_t micros) noexcept
            {
                if (epochSeconds > kMaxEpochSeconds || epochSeconds < -kMaxEpochSeconds)
                {
                    return std::nullopt;
                }
                return TimePoint(std::chrono::duration_cast<Clock::duration>(
                    seconds(epochSeconds) + std::chrono::microseconds(micros)));
            }
        } // anonymous namespace

        std::optional<TimePoint> parseIso8601(std::string_view sv)
        {
            while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
                sv.remove_prefix(1);
            while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t'))
                sv.remove_suffix(1);

            // "YYYY-MM-DDTHH:MM:SS" is the minimal accepted form.
            if (sv.size() < 19 || sv[4] != '-' || sv[7] != '-' ||
                (sv[10] != 'T' && sv[10] != 't' && sv[10] != ' ') ||
                sv[13] != ':' || sv[16] != ':')
            {
                return std::nullopt;
            }

            const auto year   = parseFixed(sv, 0, 4);
            const auto month  = parseFixed(sv, 5, 2);
            const auto day    = parseFixed(sv, 8, 2);
            const auto hour   = parseFixed(sv, 11, 2);
            const auto minute = parseFixed(sv, 14, 2);
            const auto second = parseFixed(sv, 17, 2);
            if (!year || !month || !day || !hour || !minute || !second)
            {
                return std::nullopt;
            }
            if (*month < 1 || *month > 12 || *day < 1 || *day > daysInMonth(*year, *month) ||
                *hour > 23 || *minute > 59 || *second > 59)
            {
                return std::nullopt;
            }

            std::size_t pos = 19;

            // Fractional seconds, kept to microsecond precision.
            std::int64_t micros = 0;
            if (pos < sv.size() && (sv[pos] == '.' || sv[pos] == ','))
            {
                ++pos;
                const std::size_t fracStart = pos;
                std::int64_t scale = 100000;
                while (pos < sv.size() && isDigit(sv[pos]))
                {
                    if (scale > 0)
                    {
                        micros += (sv[pos] - '0') * scale;
                        scale /= 10;
                    }
                    ++pos;
                }
                if (pos == fracStart)
                {
                    return std::nullopt;
                }
            }

            // Zone designator.
            std::int64_t offsetSeconds = 0;
            if (pos < sv.size())
            {
                const char z = sv[pos];
                if (z == 'Z' || z == 'z')
                {
                    ++pos;
                }
                else if (z == '+' || z == '-')
                {
                    const int sign = (z == '+') ? 1 : -1;
                    ++pos;
                    const auto offHour = parseFixed(sv, pos, 2);
                    if (!offHour || *offHour > 23)
                    {
                        return std::nullopt;
                    }
                    pos += 2;

                    int offMinute = 0;
                    if (pos < sv.size() && sv[pos] == ':')
                    {
                        ++pos;
                    }
                    if (pos < sv.size())
                    {
                        const auto m = parseFixed(sv, pos, 2);
                        if (!m || *m > 59)
                        {
                            return std::nullopt;
                        }
                        offMinute = *m;
                        pos += 2;
                    }
                    offsetSeconds = sign * (static_cast<std::int64_t>(*offHour) * 3600 + offMinute * 60);
                }
                else
                {
                    return std::nullopt;
                }
            }

            if (pos != sv.size())
            {
                return std::nullopt;
            }

            const std::int64_t days = daysFromCivil(*year, *month, *day);
            const std::int64_t epochSeconds =
                days * 86400 + *hour * 3600 + *minute * 60 + *second - offsetSeconds;

            return fromEpoch(epochSeconds, micros);
        }

        std::optional<TimePoint> parseUnixSeconds(std::string_view sv)
        {
            if (sv.empty())
            {
                return std::nullopt;
            }

            std::int64_t whole = 0;
            std::size_t pos = 0;
            while (pos < sv.size() && isDigit(sv[pos]))
            {
                const int digit = sv[pos] - '0';
                if (whole > (kMaxEpochSeconds - digit) / 10)
                {
                    return std::nullopt;
                }
                whole = whole * 10 + digit;
                ++pos;
            }
            if (pos == 0)
            {
                return std::nullopt;
            }

            std::int64_t micros = 0;
            if (pos < sv.size() && sv[pos] == '.')
            {
                ++pos;
                std::int64_t scale = 100000;
                while (pos < sv.size() && isDigit(sv[pos]))
                {
                    if (scale > 0)
                    {
                        micros += (sv[pos] - '0') * scale;
                        scale /= 10;
                    }
                    ++pos;
                }
            }

            if (pos != sv.size())
            {
                return std::nullopt;
            }

            return fromEpoch(whole, micros);
        }

        // -------- Epoch conversions and differences --------

        std::int64_t diffSeconds(TimePoint start, TimePoint end) noexcept
        {
            return std::chrono::duration_cast<seconds>(end - start).count();
        }

        double absDiffSeconds(TimePoint a, TimePoint b) noexcept
        {
            const std::chrono::duration<double> d = (a > b) ? (a - b) : (b - a);
            return std::abs(d.count());
        }

    } // namespace Utils
} // namespace OpsTriage
