#include "core/EventTime.hpp"

#include "core/Errors.hpp"
#include "utils/StringUtils.hpp"

namespace core
{
    using namespace OpsTriage;

    std::optional<EventTime::TimePoint> EventTime::resolve() const
    {
        if (m_time)
        {
            return m_time;
        }

        const std::string_view text = Utils::trim(m_text);
        if (text.empty())
        {
            return std::nullopt;
        }

        if (auto tp = Utils::parseIso8601(text))
        {
            return tp;
        }
        return Utils::parseUnixSeconds(text);
    }

    EventTime::TimePoint EventTime::resolveStrict(std::string_view recordId) const
    {
        if (auto tp = resolve())
        {
            return *tp;
        }

        const std::string shown = m_text.empty() ? std::string("<empty>") : m_text;
        throw MalformedInputError("timestamp", std::string(recordId),
                                  "unparseable timestamp '" + shown + "' on record '" +
                                  std::string(recordId) + "'");
    }

} // namespace core
