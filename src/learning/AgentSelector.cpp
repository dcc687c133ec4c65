#include "learning/AgentSelector.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

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
            const std::map<std::string, std::vector<std::string>>& capabilityKeywords()
            {
                static const std::map<std::string, std::vector<std::string>> keywords = {
                    {AgentSelector::kAlertOps,
                     {"alert", "correlation", "duplicate", "similar", "related", "cluster"}},
                    {AgentSelector::kPredictiveOps,
                     {"trend", "forecast", "predict", "spike", "increase", "pattern", "metric", "usage"}},
                    {AgentSelector::kPatchOps,
                     {"patch", "update", "kb", "hotfix", "version", "upgrade", "reboot", "install"}},
                    {AgentSelector::kTaskOps,
                     {"automate", "task", "workflow", "restart", "cleanup", "reset", "routine"}},
                };
                return keywords;
            }

            bool mentionsAny(const std::string& loweredText, const std::vector<std::string>& keywords)
            {
                return std::any_of(keywords.begin(), keywords.end(),
                                   [&](const std::string& k) { return contains(loweredText, k); });
            }

            constexpr std::size_t kMetricSample = 10;
            constexpr int kAlertKeywordPoints = 5;
            constexpr int kMetricKeywordPoints = 3;
            constexpr int kKeywordRelevanceCap = 40;
        } // anonymous namespace

        AgentSelector::AgentSelector(std::shared_ptr<const AdaptiveSelectionLearner> learner,
                                     SelectorConfig config)
            : m_learner(std::move(learner)),
              m_config(config)
        {
            if (!m_learner)
                throw std::invalid_argument("AgentSelector requires a learner");
        }

        SelectionDecision AgentSelector::select(const std::vector<AlertRecord>& alerts,
                                                const RelevanceScores& scores) const
        {
            return select(alerts, scores, m_config.baseThreshold);
        }

        SelectionDecision AgentSelector::select(const std::vector<AlertRecord>& alerts,
                                                const RelevanceScores& scores,
                                                int baseThreshold) const
        {
            SelectionDecision decision;
            decision.keywords = AdaptiveSelectionLearner::extractKeywords(alerts);
            decision.suggestion = m_learner->suggest(decision.keywords);

            if (decision.suggestion && decision.suggestion->confidence >= m_config.overrideConfidence)
            {
                decision.agents.assign(decision.suggestion->agents.begin(), decision.suggestion->agents.end());
                decision.threshold = baseThreshold;
                decision.learned = true;
                getLogger().log(LogLevel::INFO, "Selector",
                                "using learned agent set (" + join(decision.agents, ", ") + ")");
                return decision;
            }

            decision.threshold = m_learner->adjustThreshold(decision.keywords, baseThreshold);
            decision.agents.emplace_back(kOrchestrator);

            for (const auto& [agent, score] : scores)
            {
                if (agent == kOrchestrator)
                    continue;
                if (Stats::clampToRange(score, 0, 100) >= decision.threshold)
                    decision.agents.push_back(agent);
            }

            if (decision.agents.size() == 1)
                decision.agents.emplace_back(kAlertOps);

            getLogger().log(LogLevel::DEBUG, "Selector",
                            "threshold " + std::to_string(decision.threshold) + " selected " +
                            join(decision.agents, ", "));
            return decision;
        }

        int AgentSelector::keywordRelevance(const std::string& agent,
                                            const std::vector<AlertRecord>& alerts,
                                            const std::vector<MetricPoint>& metrics)
        {
            const auto it = capabilityKeywords().find(agent);
            if (it == capabilityKeywords().end())
                return 0;
            const auto& keywords = it->second;

            int score = 0;
            for (const auto& alert : alerts)
            {
                const std::string text = toLower(alert.title() + " " + alert.description().value_or(""));
                if (mentionsAny(text, keywords))
                    score += kAlertKeywordPoints;
            }

            const std::size_t sampled = std::min(metrics.size(), kMetricSample);
            for (std::size_t i = 0; i < sampled; ++i)
            {
                if (mentionsAny(toLower(metrics[i].metricName()), keywords))
                    score += kMetricKeywordPoints;
            }

            return std::min(score, kKeywordRelevanceCap);
        }

        RelevanceScores AgentSelector::heuristicScores(const std::vector<AlertRecord>& alerts,
                                                       const std::vector<MetricPoint>& metrics)
        {
            RelevanceScores scores;
            scores[kAlertOps] = alerts.size() > 1 ? 85 : 70;
            scores[kPredictiveOps] = metrics.size() > 10 ? 75 : 30;
            scores[kPatchOps] = keywordRelevance(kPatchOps, alerts, metrics);
            scores[kTaskOps] = keywordRelevance(kTaskOps, alerts, metrics);
            return scores;
        }

    } // namespace Learning
} // namespace OpsTriage
