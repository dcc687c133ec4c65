#include "learning/AdaptiveSelectionLearner.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include "utils/Stats.hpp"
#include "utils/StringUtils.hpp"

namespace OpsTriage
{
    namespace Learning
    {
        using namespace core;
        using namespace Utils;

        namespace
        {
            constexpr std::size_t kSignatureKeywords = 3;

            const std::array<std::string_view, 4> kStopWords = {"with", "from", "that", "this"};

            bool isStopWord(std::string_view word)
            {
                return std::find(kStopWords.begin(), kStopWords.end(), word) != kStopWords.end();
            }

            std::string describe(const AgentSet& agents)
            {
                return "[" + join(std::vector<std::string>(agents.begin(), agents.end()), ", ") + "]";
            }
        } // anonymous namespace

        AdaptiveSelectionLearner::AdaptiveSelectionLearner(std::shared_ptr<SelectionStore> store,
                                                           LearnerConfig config)
            : m_store(std::move(store)),
              m_config(config)
        {
            if (!m_store)
                throw std::invalid_argument("AdaptiveSelectionLearner requires a selection store");

            getLogger().log(LogLevel::DEBUG, "Learner",
                            "AdaptiveSelectionLearner initialized (suggest after " +
                            std::to_string(m_config.suggestMinObservations) + ", adjust after " +
                            std::to_string(m_config.thresholdMinObservations) + " observations)");
        }

        std::vector<std::string> AdaptiveSelectionLearner::extractKeywords(const std::vector<AlertRecord>& alerts)
        {
            std::vector<std::string> keywords;
            for (const auto& alert : alerts)
            {
                if (keywords.size() >= kSignatureKeywords)
                    break;

                for (const auto& word : splitWhitespace(alert.title()))
                {
                    const std::string lowered = toLower(word);
                    if (lowered.size() > 3 && !isStopWord(lowered))
                    {
                        keywords.push_back(lowered);
                        break;
                    }
                }
            }
            return keywords;
        }

        std::string AdaptiveSelectionLearner::canonicalSignature(const std::vector<std::string>& keywords)
        {
            std::vector<std::string> top;
            const std::size_t n = std::min(keywords.size(), kSignatureKeywords);
            top.reserve(n);
            for (std::size_t i = 0; i < n; ++i)
                top.push_back(toLower(keywords[i]));

            std::sort(top.begin(), top.end());
            return join(top, "_");
        }

        void AdaptiveSelectionLearner::recordOutcome(const std::vector<std::string>& keywords,
                                                     const AgentSet& agentsUsed,
                                                     double outcomeQuality)
        {
            if (!std::isfinite(outcomeQuality) || outcomeQuality < 0.0 || outcomeQuality > 1.0)
            {
                std::ostringstream oss;
                oss << "outcome quality " << outcomeQuality << " outside [0, 1]";
                throw MalformedInputError("outcome_quality", oss.str());
            }

            const std::string signature = canonicalSignature(keywords);
            m_store->append(signature, SelectionObservation{agentsUsed, outcomeQuality, now()});

            getLogger().log(LogLevel::DEBUG, "Learner",
                            "recorded " + describe(agentsUsed) + " for '" + signature + "'");
        }

        std::optional<SelectionSuggestion> AdaptiveSelectionLearner::suggest(const std::vector<std::string>& keywords) const
        {
            return suggest(keywords, m_config.suggestMinObservations);
        }

        std::optional<SelectionSuggestion> AdaptiveSelectionLearner::suggest(const std::vector<std::string>& keywords,
                                                                             std::size_t minObservations) const
        {
            const std::string signature = canonicalSignature(keywords);
            const auto history = m_store->history(signature);

            if (history.empty() || history.size() < minObservations)
                return std::nullopt;

            // Per agent set: quality sum and count, in first-seen order.
            struct Tally
            {
                AgentSet    agents;
                double      sum = 0.0;
                std::size_t count = 0;
            };
            std::vector<Tally> tallies;

            for (const auto& observation : history)
            {
                auto it = std::find_if(tallies.begin(), tallies.end(),
                                       [&](const Tally& t) { return t.agents == observation.agents; });
                if (it == tallies.end())
                {
                    tallies.push_back(Tally{observation.agents, 0.0, 0});
                    it = std::prev(tallies.end());
                }
                it->sum += observation.outcomeQuality;
                ++it->count;
            }

            const Tally* best = nullptr;
            double bestAverage = 0.0;
            for (const auto& tally : tallies)
            {
                const double average = tally.sum / static_cast<double>(tally.count);
                if (best == nullptr || average > bestAverage)
                {
                    best = &tally;
                    bestAverage = average;
                }
            }

            if (best == nullptr || bestAverage < m_config.suggestionConfidenceFloor)
            {
                getLogger().log(LogLevel::DEBUG, "Learner",
                                "no confident suggestion for '" + signature + "'");
                return std::nullopt;
            }

            SelectionSuggestion suggestion;
            suggestion.agents = best->agents;
            suggestion.confidence = bestAverage;
            suggestion.basedOn = history.size();
            const std::size_t kept = std::min(keywords.size(), kSignatureKeywords);
            suggestion.keywords.assign(keywords.begin(), keywords.begin() + static_cast<std::ptrdiff_t>(kept));

            getLogger().log(LogLevel::DEBUG, "Learner",
                            "suggesting " + describe(suggestion.agents) + " for '" + signature + "' from " +
                            std::to_string(suggestion.basedOn) + " observations");
            return suggestion;
        }

        int AdaptiveSelectionLearner::adjustThreshold(const std::vector<std::string>& keywords, int baseThreshold) const
        {
            return adjustThreshold(keywords, baseThreshold, m_config.thresholdMinObservations);
        }

        int AdaptiveSelectionLearner::adjustThreshold(const std::vector<std::string>& keywords,
                                                      int baseThreshold,
                                                      std::size_t minObservations) const
        {
            const int floor = m_config.thresholdFloor;
            const int ceiling = m_config.thresholdCeiling;

            const std::string signature = canonicalSignature(keywords);
            const auto history = m_store->history(signature);

            // Widened so a nudge from an extreme base cannot overflow before clamping.
            long long nudged = baseThreshold;
            if (!history.empty() && history.size() >= minObservations)
            {
                double sum = 0.0;
                for (const auto& observation : history)
                    sum += observation.outcomeQuality;
                const double average = sum / static_cast<double>(history.size());

                if (average >= m_config.highQualityMark)
                    nudged -= m_config.thresholdStep;
                else if (average <= m_config.lowQualityMark)
                    nudged += m_config.thresholdStep;
            }

            const int threshold = static_cast<int>(
                Stats::clampToRange<long long>(nudged, floor, ceiling));
            if (threshold != baseThreshold)
            {
                getLogger().log(LogLevel::INFO, "Learner",
                                "threshold for '" + signature + "' adjusted " +
                                std::to_string(baseThreshold) + " -> " + std::to_string(threshold));
            }
            return threshold;
        }

    } // namespace Learning
} // namespace OpsTriage
