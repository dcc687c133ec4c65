// Everything the core produced for one incident.

#ifndef CORE_INCIDENT_REPORT_HPP
#define CORE_INCIDENT_REPORT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/CorrelationResult.hpp"
#include "core/ForecastResult.hpp"
#include "core/Selection.hpp"

namespace core
{

struct IncidentReport
{
    std::string                    incidentId;   ///< "INC-" + 8 hex digits
    OpsTriage::Utils::TimePoint    processedAt{};
    AlertOverview                  overview;
    CorrelationResult              correlation;
    std::optional<ForecastSummary> forecast;     ///< only when metrics were supplied
    SelectionDecision              selection;
    std::size_t                    metricCount = 0;
};

} // namespace core

#endif // CORE_INCIDENT_REPORT_HPP
