#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "input/FileReader.hpp"
#include "input/RecordParser.hpp"

using namespace OpsTriage;
using namespace OpsTriage::Input;

namespace
{
    // Writes a throwaway JSON-lines file and removes it on scope exit.
    class TempFile
    {
    public:
        TempFile(const std::string& name, const std::string& contents)
            : m_path((std::filesystem::temp_directory_path() / name).string())
        {
            std::ofstream out(m_path, std::ios::trunc);
            out << contents;
        }

        ~TempFile()
        {
            std::error_code ec;
            std::filesystem::remove(m_path, ec);
        }

        const std::string& path() const { return m_path; }

    private:
        std::string m_path;
    };
}

TEST(RecordParser, ParsesCompleteAlert)
{
    RecordParser parser;
    const auto alert = parser.parseAlertLine(
        R"({"alert_id": "A-1", "title": "Disk full", "host": "db-01", "severity": "critical",)"
        R"( "timestamp": "2025-01-01T00:00:00Z", "description": "/var at 99%", "source": "RMM"})");

    EXPECT_EQ(alert.id(), "A-1");
    EXPECT_EQ(alert.title(), "Disk full");
    EXPECT_EQ(alert.host(), "db-01");
    EXPECT_EQ(alert.severity(), core::Severity::Critical);
    EXPECT_EQ(alert.description().value_or(""), "/var at 99%");
    EXPECT_EQ(alert.source().value_or(""), "RMM");
    EXPECT_EQ(alert.timestamp().resolveStrict(alert.id()), Testing::baseTime());
}

TEST(RecordParser, AcceptsIdFallbackAndEpochTimestamp)
{
    RecordParser parser;
    const auto alert = parser.parseAlertLine(
        R"({"id":"B","title":"CPU spike","host":"web","severity":"High","timestamp":1735689660})");

    EXPECT_EQ(alert.id(), "B");
    EXPECT_FALSE(alert.description().has_value());
    EXPECT_EQ(alert.timestamp().resolveStrict(alert.id()), Testing::baseTime() + std::chrono::seconds(60));
}

TEST(RecordParser, MissingTitleNamesField)
{
    RecordParser parser;
    try
    {
        parser.parseAlertLine(R"({"alert_id":"A","host":"h","severity":"low","timestamp":"2025-01-01T00:00:00Z"})");
        FAIL() << "expected MalformedInputError";
    }
    catch (const core::MalformedInputError& e)
    {
        EXPECT_EQ(e.field(), "title");
        EXPECT_EQ(e.recordId(), "A");
    }
}

TEST(RecordParser, RejectsUnknownSeverityAndNonObjects)
{
    RecordParser parser;
    EXPECT_THROW(parser.parseAlertLine(
                     R"({"alert_id":"A","title":"t","host":"h","severity":"urgent","timestamp":"x"})"),
                 core::MalformedInputError);
    EXPECT_THROW(parser.parseAlertLine("not json"), core::MalformedInputError);
    EXPECT_THROW(parser.parseAlertLine(R"(["A"])"), core::MalformedInputError);
}

TEST(RecordParser, ExtractFieldHandlesEscapesAndNull)
{
    const std::string json = R"({"a": "line\none \"quoted\" \u00e9", "b": null, "c": 42 , "d": "open)";

    EXPECT_EQ(RecordParser::extractField(json, "a").value_or(""), "line\none \"quoted\" \xC3\xA9");
    EXPECT_FALSE(RecordParser::extractField(json, "b").has_value());
    EXPECT_EQ(RecordParser::extractField(json, "c").value_or(""), "42");
    EXPECT_FALSE(RecordParser::extractField(json, "d").has_value());
    EXPECT_FALSE(RecordParser::extractField(json, "missing").has_value());
}

TEST(RecordParser, ValuesEqualToKeyNamesDoNotShadowKeys)
{
    RecordParser parser;
    const auto alert = parser.parseAlertLine(
        R"({"alert_id":"A1","title":"host","description":"severity","host":"db1",)"
        R"("severity":"high","timestamp":"2025-01-01T00:00:00Z"})");

    EXPECT_EQ(alert.title(), "host");
    EXPECT_EQ(alert.host(), "db1");
    EXPECT_EQ(alert.severity(), core::Severity::High);
    EXPECT_EQ(alert.description().value_or(""), "severity");
}

TEST(RecordParser, ExtractFieldIgnoresNestedMembers)
{
    const std::string json = R"({"meta": {"host": "inner", "tags": ["host", "x"]}, "note": "say "host": no", "host": "outer"})";

    EXPECT_EQ(RecordParser::extractField(json, "host").value_or(""), "outer");
    EXPECT_EQ(RecordParser::extractField(json, "meta").value_or(""), R"({"host": "inner", "tags": ["host", "x"]})");
    EXPECT_FALSE(RecordParser::extractField(json, "tags").has_value());
}

TEST(RecordParser, ParsesMetricLines)
{
    RecordParser parser;
    const auto point = parser.parseMetricLine(
        R"({"host":"web","metric_name":"cpu","value":87.5,"timestamp":"2025-01-01T00:00:00Z"})");
    EXPECT_EQ(point.host(), "web");
    EXPECT_EQ(point.metricName(), "cpu");
    EXPECT_DOUBLE_EQ(point.value(), 87.5);

    const auto fallback = parser.parseMetricLine(R"({"host":"web","metric":"mem","value":"12"})");
    EXPECT_EQ(fallback.metricName(), "mem");
    EXPECT_DOUBLE_EQ(fallback.value(), 12.0);
    EXPECT_FALSE(fallback.timestamp().resolve().has_value());

    EXPECT_THROW(parser.parseMetricLine(R"({"host":"web","metric_name":"cpu","value":"high"})"),
                 core::MalformedInputError);
    EXPECT_THROW(parser.parseMetricLine(R"({"metric_name":"cpu","value":1})"), core::MalformedInputError);
}

TEST(RecordParser, ReadsAlertFileSkippingCommentsAndBlanks)
{
    TempFile file("opstriage_alerts_ok.jsonl",
                  "# sample\n"
                  "{\"alert_id\":\"A\",\"title\":\"Disk full\",\"host\":\"h\",\"severity\":\"high\",\"timestamp\":\"2025-01-01T00:00:00Z\"}\r\n"
                  "\n"
                  "{\"alert_id\":\"B\",\"title\":\"CPU spike\",\"host\":\"h\",\"severity\":\"low\",\"timestamp\":\"2025-01-01T00:00:30Z\"}\n");

    FileReader reader(file.path());
    ASSERT_TRUE(reader.isOpen());

    const auto alerts = RecordParser().readAlerts(reader);
    ASSERT_EQ(alerts.size(), 2u);
    EXPECT_EQ(alerts[0].id(), "A");
    EXPECT_EQ(alerts[1].severity(), core::Severity::Low);
}

TEST(RecordParser, AlertFileErrorCarriesLineNumber)
{
    TempFile file("opstriage_alerts_bad.jsonl",
                  "{\"alert_id\":\"A\",\"title\":\"Disk full\",\"host\":\"h\",\"severity\":\"high\",\"timestamp\":\"2025-01-01T00:00:00Z\"}\n"
                  "{\"alert_id\":\"B\",\"host\":\"h\",\"severity\":\"high\",\"timestamp\":\"2025-01-01T00:00:00Z\"}\n");

    FileReader reader(file.path());
    try
    {
        RecordParser().readAlerts(reader);
        FAIL() << "expected MalformedInputError";
    }
    catch (const core::MalformedInputError& e)
    {
        EXPECT_EQ(e.field(), "title");
        EXPECT_NE(std::string(e.what()).find(file.path() + ":2:"), std::string::npos);
    }
}

TEST(RecordParser, MetricFileSkipsBadLines)
{
    TempFile file("opstriage_metrics.jsonl",
                  "{\"host\":\"h\",\"metric_name\":\"cpu\",\"value\":1}\n"
                  "{\"host\":\"h\",\"metric_name\":\"cpu\",\"value\":\"n/a\"}\n"
                  "garbage\n"
                  "{\"host\":\"h\",\"metric_name\":\"cpu\",\"value\":3}\n");

    FileReader reader(file.path());
    std::size_t skipped = 0;
    const auto metrics = RecordParser().readMetrics(reader, &skipped);

    ASSERT_EQ(metrics.size(), 2u);
    EXPECT_DOUBLE_EQ(metrics[1].value(), 3.0);
    EXPECT_EQ(skipped, 2u);
}

TEST(FileReader, MissingFileIsNotOpen)
{
    FileReader reader("/nonexistent/opstriage/none.jsonl");
    EXPECT_FALSE(reader.isOpen());
    EXPECT_FALSE(reader.nextLine().has_value());
}
