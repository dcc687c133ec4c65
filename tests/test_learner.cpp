#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "learning/AdaptiveSelectionLearner.hpp"

using namespace OpsTriage;
using namespace OpsTriage::Learning;
using OpsTriage::Testing::alertAt;

class AdaptiveSelectionLearnerTest : public ::testing::Test
{
protected:
    std::shared_ptr<InMemorySelectionStore> store = std::make_shared<InMemorySelectionStore>();
    AdaptiveSelectionLearner learner{store};

    const std::vector<std::string> keywords{"disk", "database", "spike"};

    void record(const core::AgentSet& agents, double quality, int times = 1)
    {
        for (int i = 0; i < times; ++i)
            learner.recordOutcome(keywords, agents, quality);
    }
};

TEST_F(AdaptiveSelectionLearnerTest, ExtractsFirstQualifyingWordPerAlert)
{
    const std::vector<core::AlertRecord> alerts = {
        alertAt("A", "h", 0, "Database unresponsive"),
        alertAt("B", "h", 1, "Disk full on host"),
        alertAt("C", "h", 2, "CPU with spike"),
        alertAt("D", "h", 3, "Network partition"),
    };

    EXPECT_EQ(AdaptiveSelectionLearner::extractKeywords(alerts),
              (std::vector<std::string>{"database", "disk", "spike"}));
}

TEST_F(AdaptiveSelectionLearnerTest, AlertsWithoutLongWordsContributeNothing)
{
    const std::vector<core::AlertRecord> alerts = {
        alertAt("A", "h", 0, "CPU hot"),
        alertAt("B", "h", 1, "Memory pressure"),
    };

    EXPECT_EQ(AdaptiveSelectionLearner::extractKeywords(alerts), (std::vector<std::string>{"memory"}));
    EXPECT_TRUE(AdaptiveSelectionLearner::extractKeywords({}).empty());
}

TEST_F(AdaptiveSelectionLearnerTest, CanonicalSignatureSortsFirstThree)
{
    EXPECT_EQ(AdaptiveSelectionLearner::canonicalSignature({"Disk", "database", "spike", "extra"}),
              "database_disk_spike");
    EXPECT_EQ(AdaptiveSelectionLearner::canonicalSignature({}), "");
}

TEST_F(AdaptiveSelectionLearnerTest, NoSuggestionBeforeMinimumObservations)
{
    record({"AlertOps", "TaskOps"}, 0.9, 2);
    EXPECT_FALSE(learner.suggest(keywords).has_value());

    record({"AlertOps", "TaskOps"}, 0.9);
    const auto suggestion = learner.suggest(keywords);
    ASSERT_TRUE(suggestion.has_value());
    EXPECT_EQ(suggestion->agents, (core::AgentSet{"AlertOps", "TaskOps"}));
    EXPECT_NEAR(suggestion->confidence, 0.9, 1e-9);
    EXPECT_EQ(suggestion->basedOn, 3u);
    EXPECT_EQ(suggestion->keywords, keywords);
}

TEST_F(AdaptiveSelectionLearnerTest, WeakHistoryGivesNoSuggestion)
{
    record({"AlertOps"}, 0.5, 6);
    EXPECT_FALSE(learner.suggest(keywords).has_value());
}

TEST_F(AdaptiveSelectionLearnerTest, BestAverageWins)
{
    record({"AlertOps"}, 0.5, 2);
    record({"PatchOps"}, 0.9);

    const auto suggestion = learner.suggest(keywords);
    ASSERT_TRUE(suggestion.has_value());
    EXPECT_EQ(suggestion->agents, core::AgentSet{"PatchOps"});
    EXPECT_EQ(suggestion->basedOn, 3u);
}

TEST_F(AdaptiveSelectionLearnerTest, TieKeepsFirstSeenSet)
{
    record({"TaskOps"}, 0.75);
    record({"AlertOps"}, 0.75);
    record({"TaskOps"}, 0.75);

    const auto suggestion = learner.suggest(keywords);
    ASSERT_TRUE(suggestion.has_value());
    EXPECT_EQ(suggestion->agents, core::AgentSet{"TaskOps"});
}

TEST_F(AdaptiveSelectionLearnerTest, KeywordOrderDoesNotMatter)
{
    record({"AlertOps"}, 0.9, 3);
    const auto suggestion = learner.suggest({"spike", "DISK", "database"});
    ASSERT_TRUE(suggestion.has_value());
    EXPECT_EQ(suggestion->agents, core::AgentSet{"AlertOps"});
}

TEST_F(AdaptiveSelectionLearnerTest, RejectsOutOfRangeQuality)
{
    EXPECT_THROW(learner.recordOutcome(keywords, {"AlertOps"}, 1.5), core::MalformedInputError);
    EXPECT_THROW(learner.recordOutcome(keywords, {"AlertOps"}, -0.1), core::MalformedInputError);
    EXPECT_THROW(learner.recordOutcome(keywords, {"AlertOps"}, std::nan("")), core::MalformedInputError);
    EXPECT_EQ(store->observationCount(), 0u);
}

TEST_F(AdaptiveSelectionLearnerTest, ThresholdUnchangedWithoutEnoughHistory)
{
    record({"AlertOps"}, 0.9, 4);
    EXPECT_EQ(learner.adjustThreshold(keywords, 60), 60);
}

TEST_F(AdaptiveSelectionLearnerTest, HighQualityLowersThreshold)
{
    record({"AlertOps"}, 0.9, 5);
    EXPECT_EQ(learner.adjustThreshold(keywords, 60), 55);
    EXPECT_EQ(learner.adjustThreshold(keywords, 52), 50);
}

TEST_F(AdaptiveSelectionLearnerTest, LowQualityRaisesThreshold)
{
    record({"AlertOps"}, 0.2, 5);
    EXPECT_EQ(learner.adjustThreshold(keywords, 60), 65);
    EXPECT_EQ(learner.adjustThreshold(keywords, 84), 85);
}

TEST_F(AdaptiveSelectionLearnerTest, MiddlingQualityKeepsThreshold)
{
    record({"AlertOps"}, 0.5, 5);
    EXPECT_EQ(learner.adjustThreshold(keywords, 60), 60);
}

TEST_F(AdaptiveSelectionLearnerTest, ThresholdAlwaysClamped)
{
    EXPECT_EQ(learner.adjustThreshold(keywords, 100), 85);
    EXPECT_EQ(learner.adjustThreshold(keywords, 10), 50);
}

TEST(AdaptiveSelectionLearner, ExtremeBaseAndStepDoNotOverflow)
{
    auto store = std::make_shared<InMemorySelectionStore>();
    core::LearnerConfig config;
    config.thresholdStep = std::numeric_limits<int>::max();
    config.thresholdMinObservations = 1;
    AdaptiveSelectionLearner learner(store, config);

    learner.recordOutcome({"disk"}, {"AlertOps"}, 0.1);
    EXPECT_EQ(learner.adjustThreshold({"disk"}, std::numeric_limits<int>::max()), 85);

    learner.recordOutcome({"cpu"}, {"AlertOps"}, 1.0);
    EXPECT_EQ(learner.adjustThreshold({"cpu"}, std::numeric_limits<int>::min()), 50);
}

TEST(AdaptiveSelectionLearner, RequiresStore)
{
    EXPECT_THROW(AdaptiveSelectionLearner(nullptr), std::invalid_argument);
}

TEST(AdaptiveSelectionLearner, ConcurrentRecordingAcrossSignatures)
{
    auto store = std::make_shared<InMemorySelectionStore>();
    AdaptiveSelectionLearner learner(store);

    std::vector<std::thread> workers;
    for (int t = 0; t < 6; ++t)
    {
        workers.emplace_back([&learner, t] {
            const std::vector<std::string> kw{t % 2 == 0 ? "disk" : "network", "spike"};
            for (int i = 0; i < 200; ++i)
            {
                learner.recordOutcome(kw, {"AlertOps"}, 0.9);
                (void)learner.suggest(kw);
                (void)learner.adjustThreshold(kw, 60);
            }
        });
    }
    for (auto& w : workers)
        w.join();

    EXPECT_EQ(store->observationCount(), 1200u);
    EXPECT_EQ(store->history("disk_spike").size(), 600u);
    EXPECT_EQ(learner.adjustThreshold({"spike", "network"}, 60), 55);
}
