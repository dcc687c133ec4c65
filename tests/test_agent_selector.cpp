#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "TestSupport.hpp"
#include "learning/AgentSelector.hpp"

using namespace OpsTriage;
using namespace OpsTriage::Learning;
using OpsTriage::Testing::alertAt;
using OpsTriage::Testing::metricAt;

class AgentSelectorTest : public ::testing::Test
{
protected:
    std::shared_ptr<AdaptiveSelectionLearner> learner =
        std::make_shared<AdaptiveSelectionLearner>(std::make_shared<InMemorySelectionStore>());
    AgentSelector selector{learner};

    std::vector<core::AlertRecord> alerts{
        alertAt("A", "web-01", 0, "Database unresponsive"),
        alertAt("B", "web-01", 30, "Disk full on host"),
    };

    void record(const core::AgentSet& agents, double quality, int times)
    {
        const auto keywords = AdaptiveSelectionLearner::extractKeywords(alerts);
        for (int i = 0; i < times; ++i)
            learner->recordOutcome(keywords, agents, quality);
    }
};

TEST_F(AgentSelectorTest, HeuristicCountsAlertsAndMetrics)
{
    std::vector<core::MetricPoint> metrics;
    for (int i = 0; i < 11; ++i)
        metrics.push_back(metricAt("web-01", "cpu", i, i * 60));

    auto scores = AgentSelector::heuristicScores(alerts, metrics);
    EXPECT_EQ(scores[AgentSelector::kAlertOps], 85);
    EXPECT_EQ(scores[AgentSelector::kPredictiveOps], 75);

    scores = AgentSelector::heuristicScores({alerts.front()}, {});
    EXPECT_EQ(scores[AgentSelector::kAlertOps], 70);
    EXPECT_EQ(scores[AgentSelector::kPredictiveOps], 30);
    EXPECT_EQ(scores[AgentSelector::kPatchOps], 0);
    EXPECT_EQ(scores[AgentSelector::kTaskOps], 0);
}

TEST_F(AgentSelectorTest, KeywordRelevanceScoresAlertsAndSampledMetrics)
{
    const std::vector<core::AlertRecord> patchAlerts{
        alertAt("P1", "h", 0, "Pending hotfix install"),
        alertAt("P2", "h", 1, "Service degraded"),
    };
    std::vector<core::MetricPoint> metrics;
    for (int i = 0; i < 12; ++i)
        metrics.push_back(metricAt("h", i < 2 ? "patch_age" : "cpu", 1.0, i));

    EXPECT_EQ(AgentSelector::keywordRelevance(AgentSelector::kPatchOps, patchAlerts, metrics), 5 + 2 * 3);
    EXPECT_EQ(AgentSelector::keywordRelevance("Unknown", patchAlerts, metrics), 0);
}

TEST_F(AgentSelectorTest, KeywordRelevanceIsCapped)
{
    std::vector<core::AlertRecord> many;
    for (int i = 0; i < 10; ++i)
        many.push_back(alertAt("R" + std::to_string(i), "h", i, "Restart required"));

    EXPECT_EQ(AgentSelector::keywordRelevance(AgentSelector::kTaskOps, many, {}), 40);
}

TEST_F(AgentSelectorTest, EngagesAgentsAtOrAboveThreshold)
{
    const RelevanceScores scores{
        {AgentSelector::kAlertOps, 85},
        {AgentSelector::kPatchOps, 10},
        {AgentSelector::kPredictiveOps, 75},
        {AgentSelector::kTaskOps, 60},
    };

    const auto decision = selector.select(alerts, scores);
    EXPECT_FALSE(decision.learned);
    EXPECT_FALSE(decision.suggestion.has_value());
    EXPECT_EQ(decision.threshold, 60);
    EXPECT_EQ(decision.agents, (std::vector<std::string>{"Orchestrator", "AlertOps", "PredictiveOps", "TaskOps"}));
    EXPECT_EQ(decision.keywords, (std::vector<std::string>{"database", "disk"}));
}

TEST_F(AgentSelectorTest, FallsBackToAlertOps)
{
    const RelevanceScores scores{{AgentSelector::kPatchOps, 10}, {AgentSelector::kTaskOps, 20}};

    const auto decision = selector.select(alerts, scores);
    EXPECT_EQ(decision.agents, (std::vector<std::string>{"Orchestrator", "AlertOps"}));
}

TEST_F(AgentSelectorTest, ScoresAndThresholdAreClamped)
{
    const RelevanceScores scores{{AgentSelector::kPatchOps, 150}, {AgentSelector::kTaskOps, 84}};

    const auto decision = selector.select(alerts, scores, 100);
    EXPECT_EQ(decision.threshold, 85);
    EXPECT_EQ(decision.agents, (std::vector<std::string>{"Orchestrator", "PatchOps"}));
}

TEST_F(AgentSelectorTest, ConfidentSuggestionOverridesScores)
{
    record({"TaskOps", "PatchOps"}, 0.9, 3);

    const RelevanceScores scores{{AgentSelector::kAlertOps, 95}};
    const auto decision = selector.select(alerts, scores);

    EXPECT_TRUE(decision.learned);
    EXPECT_EQ(decision.threshold, 60);
    EXPECT_EQ(decision.agents, (std::vector<std::string>{"PatchOps", "TaskOps"}));
    ASSERT_TRUE(decision.suggestion.has_value());
    EXPECT_EQ(decision.suggestion->basedOn, 3u);
}

TEST_F(AgentSelectorTest, ModestSuggestionOnlyAdjustsThreshold)
{
    record({"PatchOps"}, 0.8, 5);

    const RelevanceScores scores{{AgentSelector::kAlertOps, 57}, {AgentSelector::kPatchOps, 50}};
    const auto decision = selector.select(alerts, scores);

    EXPECT_FALSE(decision.learned);
    ASSERT_TRUE(decision.suggestion.has_value());
    EXPECT_EQ(decision.suggestion->agents, core::AgentSet{"PatchOps"});
    EXPECT_EQ(decision.threshold, 55);
    EXPECT_EQ(decision.agents, (std::vector<std::string>{"Orchestrator", "AlertOps"}));
}

TEST(AgentSelector, RequiresLearner)
{
    EXPECT_THROW(AgentSelector(nullptr), std::invalid_argument);
}
