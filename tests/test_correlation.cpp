#include <gtest/gtest.h>

#include <vector>

#include "TestSupport.hpp"
#include "analysis/CorrelationGraphEngine.hpp"
#include "core/Errors.hpp"

using namespace OpsTriage;
using OpsTriage::Testing::alertAt;

namespace
{
    class CorrelationGraphEngineTest : public ::testing::Test
    {
    protected:
        Analysis::CorrelationGraphEngine engine;
    };
}

TEST_F(CorrelationGraphEngineTest, ClustersDatabaseAlertsAndExcludesUnrelatedDisk)
{
    const std::vector<core::AlertRecord> alerts{
        alertAt("A", "db1", 0, "Database unresponsive"),
        alertAt("B", "db1", 10, "Database timeout"),
        alertAt("C", "web1", 500, "Disk full"),
    };

    const auto result = engine.correlate(alerts);

    ASSERT_TRUE(result.primaryAlertId.has_value());
    EXPECT_EQ(*result.primaryAlertId, "A");
    EXPECT_EQ(result.relatedAlertIds, std::vector<std::string>{"B"});
    EXPECT_EQ(result.suppressedCount, 1u);
    EXPECT_DOUBLE_EQ(result.confidence, 0.85);
    EXPECT_EQ(result.rootCause, "Database unresponsive");
    ASSERT_EQ(result.reasoning.size(), 3u);
    EXPECT_EQ(result.reasoning[0], "Identified cluster of 2 related alerts");
    EXPECT_EQ(result.reasoning[1], "Primary alert: Database unresponsive on db1");
    EXPECT_EQ(result.reasoning[2], "Time span: 10s");

    ASSERT_EQ(result.edges.size(), 1u);
    EXPECT_EQ(result.edges[0].a, "A");
    EXPECT_EQ(result.edges[0].b, "B");
    EXPECT_NEAR(result.edges[0].score, 0.8, 1e-9);
    EXPECT_EQ(result.edges[0].signals,
              (std::vector<std::string>{"same_host", "time_proximity", "keyword_match"}));
}

TEST_F(CorrelationGraphEngineTest, EmptyBatchHasNoPrimary)
{
    const auto result = engine.correlate({});
    EXPECT_FALSE(result.primaryAlertId.has_value());
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);
    EXPECT_EQ(result.suppressedCount, 0u);
    EXPECT_EQ(result.rootCause, "No alerts");
}

TEST_F(CorrelationGraphEngineTest, SingleAlertShortCircuits)
{
    const auto result = engine.correlate({alertAt("only", "h1", 0, "Service down")});
    ASSERT_TRUE(result.primaryAlertId.has_value());
    EXPECT_EQ(*result.primaryAlertId, "only");
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);
    EXPECT_EQ(result.suppressedCount, 0u);
    EXPECT_TRUE(result.relatedAlertIds.empty());
    EXPECT_EQ(result.rootCause, "Service down");
    EXPECT_EQ(result.reasoning, std::vector<std::string>{"Only one alert, no correlation needed"});
}

TEST_F(CorrelationGraphEngineTest, UnrelatedAlertsGetLowConfidence)
{
    const std::vector<core::AlertRecord> alerts{
        alertAt("X", "web1", 0, "Disk full"),
        alertAt("Y", "db2", 900, "Replication lag"),
    };

    const auto result = engine.correlate(alerts);
    ASSERT_TRUE(result.primaryAlertId.has_value());
    EXPECT_EQ(*result.primaryAlertId, "X");
    EXPECT_DOUBLE_EQ(result.confidence, 0.3);
    EXPECT_EQ(result.rootCause, "No clear correlation detected");
    EXPECT_EQ(result.reasoning, std::vector<std::string>{"Alerts appear unrelated"});
    EXPECT_EQ(result.suppressedCount, 0u);
    EXPECT_TRUE(result.edges.empty());
}

TEST_F(CorrelationGraphEngineTest, SixtySecondsApartStillCountsAsProximate)
{
    const auto a = alertAt("a", "db1", 0, "Database slow");
    const auto b = alertAt("b", "db1", 60, "Database slow queries");

    const auto pair = engine.pairSimilarity(a, b);
    // same host + time + two shared tokens ("database", "slow")
    EXPECT_NEAR(pair.score, 0.9, 1e-9);

    const auto result = engine.correlate({a, b});
    EXPECT_DOUBLE_EQ(result.confidence, 0.85);
    EXPECT_EQ(result.suppressedCount, 1u);
}

TEST_F(CorrelationGraphEngineTest, ScoreExactlyAtThresholdIsNotAnEdge)
{
    // same host (0.4) + one shared keyword (0.1), 61s apart: 0.5 is not > 0.5
    const auto a = alertAt("a", "db1", 0, "Database unresponsive");
    const auto b = alertAt("b", "db1", 61, "Database restarted");

    EXPECT_NEAR(engine.pairSimilarity(a, b).score, 0.5, 1e-9);
    const auto result = engine.correlate({a, b});
    EXPECT_TRUE(result.edges.empty());
    EXPECT_DOUBLE_EQ(result.confidence, 0.3);
}

TEST_F(CorrelationGraphEngineTest, KeywordContributionIsCapped)
{
    const auto a = alertAt("a", "h1", 0, "kernel panic on node alpha");
    const auto b = alertAt("b", "h2", 3600, "Kernel PANIC on NODE alpha");

    const auto pair = engine.pairSimilarity(a, b);
    EXPECT_NEAR(pair.score, 0.3, 1e-9);
    EXPECT_EQ(pair.signals, std::vector<std::string>{"keyword_match"});
}

TEST_F(CorrelationGraphEngineTest, SameHostAndTimeWithoutKeywordsStillLinks)
{
    const auto a = alertAt("a", "h1", 0, "CPU high");
    const auto b = alertAt("b", "h1", 30, "Memory pressure");
    EXPECT_NEAR(engine.pairSimilarity(a, b).score, 0.7, 1e-9);
    EXPECT_EQ(engine.correlate({a, b}).suppressedCount, 1u);
}

TEST_F(CorrelationGraphEngineTest, ProximityUsesUtcNormalizedTimes)
{
    const core::AlertRecord a("a", "Database down", "db1", core::Severity::Critical,
                              core::EventTime::fromText("2025-01-01T00:00:00Z"));
    const core::AlertRecord b("b", "Queue backlog", "mq1", core::Severity::High,
                              core::EventTime::fromText("2025-01-01T02:00:30+02:00"));

    const auto pair = engine.pairSimilarity(a, b);
    EXPECT_EQ(pair.signals, std::vector<std::string>{"time_proximity"});
}

TEST_F(CorrelationGraphEngineTest, ClusterMembersAreOrderedByTimestamp)
{
    const std::vector<core::AlertRecord> alerts{
        alertAt("third", "db1", 20, "Database error"),
        alertAt("first", "db1", 0, "Database error"),
        alertAt("second", "db1", 10, "Database error"),
    };

    const auto result = engine.correlate(alerts);
    EXPECT_EQ(*result.primaryAlertId, "first");
    EXPECT_EQ(result.relatedAlertIds, (std::vector<std::string>{"second", "third"}));
    EXPECT_EQ(result.suppressedCount, 2u);
    EXPECT_EQ(result.reasoning[0], "Identified cluster of 3 related alerts");
    EXPECT_EQ(result.reasoning[2], "Time span: 20s");
}

TEST_F(CorrelationGraphEngineTest, LargestComponentWins)
{
    const std::vector<core::AlertRecord> alerts{
        alertAt("p1", "h1", 0, "Disk full"),
        alertAt("p2", "h1", 5, "Disk full"),
        alertAt("q1", "h2", 1000, "CPU high"),
        alertAt("q2", "h2", 1005, "CPU high"),
        alertAt("q3", "h2", 1010, "CPU high"),
    };

    const auto result = engine.correlate(alerts);
    EXPECT_EQ(*result.primaryAlertId, "q1");
    EXPECT_EQ(result.suppressedCount, 2u);
}

TEST_F(CorrelationGraphEngineTest, EqualComponentsPreferEarliestPrimary)
{
    const std::vector<core::AlertRecord> alerts{
        alertAt("x1", "h1", 100, "CPU high"),
        alertAt("x2", "h1", 110, "CPU high"),
        alertAt("y1", "h2", 0, "Disk full"),
        alertAt("y2", "h2", 5, "Disk full"),
    };

    EXPECT_EQ(*engine.correlate(alerts).primaryAlertId, "y1");
}

TEST_F(CorrelationGraphEngineTest, EqualComponentsWithEqualStartPreferLexicalId)
{
    const std::vector<core::AlertRecord> alerts{
        alertAt("b1", "h1", 0, "CPU high"),
        alertAt("b2", "h1", 5, "CPU high"),
        alertAt("a1", "h2", 0, "Disk full"),
        alertAt("a2", "h2", 5, "Disk full"),
    };

    const auto result = engine.correlate(alerts);
    EXPECT_EQ(*result.primaryAlertId, "a1");
    EXPECT_EQ(result.relatedAlertIds, std::vector<std::string>{"a2"});
}

TEST_F(CorrelationGraphEngineTest, CorrelateIsIdempotent)
{
    const std::vector<core::AlertRecord> alerts{
        alertAt("A", "db1", 0, "Database unresponsive"),
        alertAt("B", "db1", 10, "Database timeout"),
        alertAt("C", "web1", 500, "Disk full"),
        alertAt("D", "web1", 505, "Disk almost full"),
    };

    EXPECT_EQ(engine.correlate(alerts), engine.correlate(alerts));
}

TEST_F(CorrelationGraphEngineTest, UnparseableTimestampIsRejected)
{
    const std::vector<core::AlertRecord> alerts{
        alertAt("A", "db1", 0, "Database unresponsive"),
        core::AlertRecord("B", "Database timeout", "db1", core::Severity::High,
                          core::EventTime::fromText("last tuesday")),
    };

    try
    {
        engine.correlate(alerts);
        FAIL() << "expected MalformedInputError";
    }
    catch (const core::MalformedInputError& e)
    {
        EXPECT_EQ(e.field(), "timestamp");
        EXPECT_EQ(e.recordId(), "B");
    }
}

TEST_F(CorrelationGraphEngineTest, OutOfRangeTimestampsAreRejected)
{
    for (const char* text : {"1735689600000", "99999999999999999999", "2300-01-01T00:00:00Z"})
    {
        const std::vector<core::AlertRecord> alerts{
            core::AlertRecord("A", "Database unresponsive", "db1", core::Severity::High,
                              core::EventTime::fromText(text)),
            core::AlertRecord("B", "Database timeout", "db1", core::Severity::High,
                              core::EventTime::fromText(text)),
        };
        EXPECT_THROW(engine.correlate(alerts), core::MalformedInputError) << text;
    }
}

TEST_F(CorrelationGraphEngineTest, MissingRequiredFieldsAreRejected)
{
    EXPECT_THROW(engine.correlate({alertAt("", "h1", 0, "Title")}), core::MalformedInputError);
    EXPECT_THROW(engine.correlate({alertAt("a", "h1", 0, "  ")}), core::MalformedInputError);
    EXPECT_THROW(engine.correlate({alertAt("a", "", 0, "Title")}), core::MalformedInputError);
}

TEST_F(CorrelationGraphEngineTest, DuplicateIdsAreRejected)
{
    EXPECT_THROW(engine.correlate({alertAt("a", "h1", 0, "One"), alertAt("a", "h2", 5, "Two")}),
                 core::MalformedInputError);
}

TEST_F(CorrelationGraphEngineTest, CustomWeightsAndThresholdAreHonoured)
{
    core::CorrelationConfig cfg;
    cfg.timeWindowSeconds = 600;
    const Analysis::CorrelationGraphEngine wide(cfg);

    const auto a = alertAt("a", "db1", 0, "Database unresponsive");
    const auto b = alertAt("b", "db1", 300, "Replica lagging");
    EXPECT_NEAR(wide.pairSimilarity(a, b).score, 0.7, 1e-9);
    EXPECT_NEAR(engine.pairSimilarity(a, b).score, 0.4, 1e-9);
}

TEST_F(CorrelationGraphEngineTest, SummarizesBatch)
{
    auto a = core::AlertRecord("a", "Disk full", "web1", core::Severity::Critical,
                               core::EventTime(Testing::baseTime()), std::nullopt, std::string("RMM"));
    auto b = core::AlertRecord("b", "CPU high", "db1", core::Severity::High,
                               core::EventTime(Testing::baseTime() + std::chrono::seconds(30)),
                               std::nullopt, std::string("SIEM"));
    auto c = core::AlertRecord("c", "CPU high", "db1", core::Severity::High,
                               core::EventTime(Testing::baseTime() + std::chrono::seconds(90)),
                               std::nullopt, std::string("RMM"));

    const auto overview = engine.summarizeAlerts({a, b, c});
    EXPECT_EQ(overview.totalAlerts, 3u);
    EXPECT_EQ(overview.severityBreakdown.at(core::Severity::High), 2u);
    EXPECT_EQ(overview.severityBreakdown.at(core::Severity::Critical), 1u);
    EXPECT_EQ(overview.affectedHosts, (std::vector<std::string>{"db1", "web1"}));
    EXPECT_EQ(overview.sources, (std::vector<std::string>{"RMM", "SIEM"}));
    ASSERT_TRUE(overview.windowStart && overview.windowEnd);
    EXPECT_EQ(Utils::diffSeconds(*overview.windowStart, *overview.windowEnd), 90);
}
