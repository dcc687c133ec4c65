// Core data model representing a single ingested infrastructure alert.
//
// Alerts are produced by the ingestion path and consumed read-only by the
// analytics core. Value type: cheap to copy into STL containers.

#ifndef CORE_ALERT_RECORD_HPP
#define CORE_ALERT_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/EventTime.hpp"
#include "utils/StringUtils.hpp"

namespace core
{

/**
 * @brief Alert severity, ordered info < low < medium < high < critical.
 */
enum class Severity : std::uint8_t
{
    Info = 0,
    Low,
    Medium,
    High,
    Critical
};

inline const char* severityToString(Severity s) noexcept
{
    switch (s)
    {
    case Severity::Info:     return "info";
    case Severity::Low:      return "low";
    case Severity::Medium:   return "medium";
    case Severity::High:     return "high";
    case Severity::Critical: return "critical";
    }
    return "unknown";
}

/// Case-insensitive severity parse; nullopt for unknown names.
inline std::optional<Severity> parseSeverity(std::string_view text)
{
    const std::string_view t = OpsTriage::Utils::trim(text);
    if (OpsTriage::Utils::iequals(t, "info"))     return Severity::Info;
    if (OpsTriage::Utils::iequals(t, "low"))      return Severity::Low;
    if (OpsTriage::Utils::iequals(t, "medium"))   return Severity::Medium;
    if (OpsTriage::Utils::iequals(t, "high"))     return Severity::High;
    if (OpsTriage::Utils::iequals(t, "critical")) return Severity::Critical;
    return std::nullopt;
}

/**
 * @brief Immutable alert record.
 *
 * Required: id, title, host, severity, timestamp.
 * Optional: description, source (RMM, SIEM, CloudWatch, ...).
 *
 * The record does not validate itself; the correlation engine rejects
 * records with empty required fields or unresolvable timestamps.
 */
class AlertRecord
{
public:
    AlertRecord() = default;

    AlertRecord(std::string id,
                std::string title,
                std::string host,
                Severity severity,
                EventTime timestamp,
                std::optional<std::string> description = std::nullopt,
                std::optional<std::string> source = std::nullopt)
        : m_id(std::move(id)),
          m_title(std::move(title)),
          m_host(std::move(host)),
          m_severity(severity),
          m_timestamp(std::move(timestamp)),
          m_description(std::move(description)),
          m_source(std::move(source))
    {
    }

    const std::string& id() const noexcept { return m_id; }
    const std::string& title() const noexcept { return m_title; }
    const std::string& host() const noexcept { return m_host; }
    Severity severity() const noexcept { return m_severity; }
    const EventTime& timestamp() const noexcept { return m_timestamp; }
    const std::optional<std::string>& description() const noexcept { return m_description; }
    const std::optional<std::string>& source() const noexcept { return m_source; }

private:
    std::string                m_id;
    std::string                m_title;
    std::string                m_host;
    Severity                   m_severity{Severity::Info};
    EventTime                  m_timestamp;
    std::optional<std::string> m_description;
    std::optional<std::string> m_source;
};

} // namespace core

#endif // CORE_ALERT_RECORD_HPP
