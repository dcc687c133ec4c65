// Records used by adaptive specialist selection.

#ifndef CORE_SELECTION_HPP
#define CORE_SELECTION_HPP

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "utils/TimeUtils.hpp"

namespace core
{

/// Specialist names, kept sorted so equal sets compare equal.
using AgentSet = std::set<std::string>;

/// One recorded incident outcome. Never mutated once appended.
struct SelectionObservation
{
    AgentSet                    agents;
    double                      outcomeQuality = 0.0;   ///< [0, 1]
    OpsTriage::Utils::TimePoint observedAt{};
};

/// Best-performing agent set for a signature bucket.
struct SelectionSuggestion
{
    AgentSet                 agents;
    double                   confidence = 0.0;   ///< average outcome quality
    std::size_t              basedOn = 0;        ///< observations in the bucket
    std::vector<std::string> keywords;
};

/// What the selector decided for one incident.
struct SelectionDecision
{
    std::vector<std::string>           agents;      ///< "Orchestrator" first when threshold-driven
    int                                threshold = 0;
    bool                               learned = false;
    std::optional<SelectionSuggestion> suggestion;
    std::vector<std::string>           keywords;
};

} // namespace core

#endif // CORE_SELECTION_HPP
