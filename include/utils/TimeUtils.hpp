#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

namespace OpsTriage
{
    namespace Utils
    {
        /**
         * Time utilities shared by ingestion, correlation and forecasting.
         *
         * Design goals:
         *  - Use std::chrono types for strong typing and precision.
         *  - Avoid global mutable state; all functions are thread-safe.
         *  - Parsing functions return std::optional to signal failures; the
         *    caller decides whether a failure is fatal (correlation) or
         *    tolerated (forecast grouping).
         *
         * All parsed timestamps are normalized to UTC. Strings without a zone
         * designator are read as UTC.
         */

        using Clock        = std::chrono::system_clock;
        using TimePoint    = std::chrono::time_point<Clock>;
        using milliseconds = std::chrono::milliseconds;
        using seconds      = std::chrono::seconds;

        /// Convert a time_t to TimePoint (system_clock).
        TimePoint from_time_t(std::time_t t) noexcept;

        /// Convert a TimePoint to time_t (second precision).
        std::time_t to_time_t(TimePoint tp) noexcept;

        /// Current wall-clock time.
        TimePoint now() noexcept;

        /**
         * Format a TimePoint in local time.
         *
         * Default format: "YYYY-MM-DD HH:MM:SS". Used for log lines and the
         * console report.
         */
        std::string formatTimestamp(TimePoint tp,
                                     std::string_view format = "%Y-%m-%d %H:%M:%S");

        /// Format as UTC ISO-8601 with a trailing 'Z': "YYYY-MM-DDTHH:MM:SSZ".
        std::string toIso8601Utc(TimePoint tp);

        /**
         * Parse an ISO-8601 timestamp.
         *
         * Accepted: "YYYY-MM-DD[T| ]HH:MM:SS[.frac][Z|+HH:MM|-HH:MM|+HHMM|+HH]".
         * Calendar fields are range-checked; anything trailing the zone
         * designator makes the string invalid. Instants more than half the
         * clock's range away from the epoch (roughly before 1824 or after
         * 2116) are rejected.
         */
        std::optional<TimePoint> parseIso8601(std::string_view sv);

        /**
         * Parse a UNIX timestamp (whole or fractional seconds since epoch).
         * Same range limit as parseIso8601, so epoch milliseconds are rejected
         * rather than misread.
         */
        std::optional<TimePoint> parseUnixSeconds(std::string_view sv);

        /// Duration between two time points in whole seconds (end - start).
        std::int64_t diffSeconds(TimePoint start, TimePoint end) noexcept;

        /// Absolute distance between two time points in fractional seconds.
        double absDiffSeconds(TimePoint a, TimePoint b) noexcept;

    } // namespace Utils
} // namespace OpsTriage
