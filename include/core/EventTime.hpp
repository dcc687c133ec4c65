// Timestamp carried by ingested records.
//
// Records may arrive with an already-structured time point or with the raw
// text the producer emitted. Resolution is deferred to the consumer so that
// correlation (strict) and forecast grouping (lenient) can apply their own
// policy to the same record type.

#ifndef CORE_EVENT_TIME_HPP
#define CORE_EVENT_TIME_HPP

#include <optional>
#include <string>
#include <string_view>

#include "utils/TimeUtils.hpp"

namespace core
{

class EventTime
{
public:
    using TimePoint = OpsTriage::Utils::TimePoint;

    EventTime() = default;

    /// Structured timestamp; always resolves.
    EventTime(TimePoint tp)  // NOLINT(google-explicit-constructor)
        : m_time(tp)
    {
    }

    /// Raw timestamp text (ISO-8601 or epoch seconds); resolved on demand.
    static EventTime fromText(std::string text)
    {
        EventTime t;
        t.m_text = std::move(text);
        return t;
    }

    bool isStructured() const noexcept
    {
        return m_time.has_value();
    }

    /// Original text, empty for structured timestamps.
    const std::string& text() const noexcept
    {
        return m_text;
    }

    /**
     * @brief Resolve to a time point, or nullopt when the text is unparseable.
     *
     * Text is tried as ISO-8601 first, then as UNIX seconds.
     */
    std::optional<TimePoint> resolve() const;

    /**
     * @brief Resolve or throw MalformedInputError naming the record.
     */
    TimePoint resolveStrict(std::string_view recordId) const;

private:
    std::optional<TimePoint> m_time;
    std::string              m_text;
};

} // namespace core

#endif // CORE_EVENT_TIME_HPP
