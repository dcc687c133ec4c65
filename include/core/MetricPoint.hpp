#ifndef CORE_METRIC_POINT_HPP
#define CORE_METRIC_POINT_HPP

#include <string>

#include "core/EventTime.hpp"

namespace core
{

/**
 * @brief One observation of a (host, metric) series.
 *
 * The timestamp may be structured or raw text; the forecaster resolves it
 * leniently when grouping.
 */
class MetricPoint
{
public:
    MetricPoint() = default;

    MetricPoint(std::string host, std::string metricName, double value, EventTime timestamp)
        : m_host(std::move(host)),
          m_metricName(std::move(metricName)),
          m_value(value),
          m_timestamp(std::move(timestamp))
    {
    }

    const std::string& host() const noexcept { return m_host; }
    const std::string& metricName() const noexcept { return m_metricName; }
    double value() const noexcept { return m_value; }
    const EventTime& timestamp() const noexcept { return m_timestamp; }

private:
    std::string m_host;
    std::string m_metricName;
    double      m_value{0.0};
    EventTime   m_timestamp;
};

} // namespace core

#endif // CORE_METRIC_POINT_HPP
