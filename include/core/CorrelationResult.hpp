// Result of correlating one batch of alerts.

#ifndef CORE_CORRELATION_RESULT_HPP
#define CORE_CORRELATION_RESULT_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/AlertRecord.hpp"
#include "utils/TimeUtils.hpp"

namespace core
{

/// Accepted edge of the correlation graph.
struct CorrelationEdge
{
    std::string              a;
    std::string              b;
    double                   score = 0.0;
    std::vector<std::string> signals;   ///< same_host, time_proximity, keyword_match

    bool operator==(const CorrelationEdge& other) const
    {
        return a == other.a && b == other.b && score == other.score && signals == other.signals;
    }
};

/**
 * @brief Dominant incident cluster with a coarse, explainable confidence.
 *
 * confidence is 1.0 for the single-alert shortcut, 0.85 when a cluster was
 * found through edges and 0.3 when no pair cleared the edge threshold. It is
 * not a calibrated probability.
 */
struct CorrelationResult
{
    std::optional<std::string>   primaryAlertId;   ///< nullopt only for empty input
    std::vector<std::string>     relatedAlertIds;  ///< timestamp order
    double                       confidence = 0.0;
    std::string                  rootCause;
    std::vector<std::string>     reasoning;
    std::size_t                  suppressedCount = 0;
    std::vector<CorrelationEdge> edges;

    bool operator==(const CorrelationResult& other) const
    {
        return primaryAlertId == other.primaryAlertId &&
               relatedAlertIds == other.relatedAlertIds &&
               confidence == other.confidence &&
               rootCause == other.rootCause &&
               reasoning == other.reasoning &&
               suppressedCount == other.suppressedCount &&
               edges == other.edges;
    }
};

/// Perception-style context over an alert batch.
struct AlertOverview
{
    std::size_t                                totalAlerts = 0;
    std::map<Severity, std::size_t>            severityBreakdown;
    std::vector<std::string>                   affectedHosts;   ///< sorted, unique
    std::vector<std::string>                   sources;         ///< sorted, unique
    std::optional<OpsTriage::Utils::TimePoint> windowStart;
    std::optional<OpsTriage::Utils::TimePoint> windowEnd;
};

} // namespace core

#endif // CORE_CORRELATION_RESULT_HPP
