#include "report/JsonReporter.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

namespace OpsTriage
{
namespace Report
{
    JsonReporter::JsonReporter(PrettyPrint pretty)
        : m_prettyPrint(pretty)
    {
    }

    void JsonReporter::generateReport(const core::IncidentReport& report)
    {
        m_report = report;
        Utils::getLogger().log(Utils::LogLevel::TRACE, "Report",
                               "json report prepared for " + report.incidentId);
    }

    void JsonReporter::writeJson(std::ostream& output) const
    {
        if (m_prettyPrint == PrettyPrint::PRETTY)
            writePrettyJson(output);
        else
            writeCompactJson(output);
    }

    std::string JsonReporter::getJsonString() const
    {
        std::ostringstream oss;
        writeJson(oss);
        return oss.str();
    }

    void JsonReporter::setPrettyPrint(PrettyPrint mode) noexcept
    {
        m_prettyPrint = mode;
    }

    std::string JsonReporter::overviewToJson(const core::AlertOverview& overview) const
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"totalAlerts\":" << overview.totalAlerts << ",";

        oss << "\"severityBreakdown\":{";
        bool first = true;
        for (const auto& [severity, count] : overview.severityBreakdown)
        {
            if (!first) oss << ",";
            first = false;
            oss << quoted(core::severityToString(severity)) << ":" << count;
        }
        oss << "},";

        oss << "\"affectedHosts\":" << stringArray(overview.affectedHosts) << ",";
        oss << "\"sources\":" << stringArray(overview.sources) << ",";

        oss << "\"timeWindow\":";
        if (overview.windowStart && overview.windowEnd)
        {
            oss << "{\"start\":" << quoted(Utils::toIso8601Utc(*overview.windowStart))
                << ",\"end\":" << quoted(Utils::toIso8601Utc(*overview.windowEnd)) << "}";
        }
        else
        {
            oss << "null";
        }
        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::correlationToJson(const core::CorrelationResult& c) const
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"primaryAlertId\":" << (c.primaryAlertId ? quoted(*c.primaryAlertId) : "null") << ",";
        oss << "\"relatedAlertIds\":" << stringArray(c.relatedAlertIds) << ",";
        oss << "\"confidence\":" << number(c.confidence, 2) << ",";
        oss << "\"rootCause\":" << quoted(c.rootCause) << ",";
        oss << "\"reasoning\":" << stringArray(c.reasoning) << ",";
        oss << "\"suppressedCount\":" << c.suppressedCount << ",";

        oss << "\"edges\":[";
        for (std::size_t i = 0; i < c.edges.size(); ++i)
        {
            const auto& e = c.edges[i];
            if (i) oss << ",";
            oss << "{\"a\":" << quoted(e.a)
                << ",\"b\":" << quoted(e.b)
                << ",\"score\":" << number(e.score, 2)
                << ",\"signals\":" << stringArray(e.signals) << "}";
        }
        oss << "]";

        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::forecastResultToJson(const core::ForecastResult& r)
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"host\":" << quoted(r.host) << ",";
        oss << "\"metric\":" << quoted(r.metric) << ",";
        oss << "\"lastValue\":" << number(r.lastValue, 2) << ",";
        oss << "\"trend\":" << number(r.trend, 4) << ",";
        oss << "\"forecast\":[";
        for (std::size_t i = 0; i < r.forecast.size(); ++i)
        {
            if (i) oss << ",";
            oss << number(r.forecast[i], 2);
        }
        oss << "],";
        oss << "\"anomalyScore\":" << number(r.anomalyScore, 3) << ",";
        oss << "\"latestResidual\":" << number(r.latestResidual, 3);
        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::forecastToJson(const core::ForecastSummary& f) const
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"generatedAt\":" << quoted(Utils::toIso8601Utc(f.generatedAt)) << ",";
        oss << "\"horizon\":" << f.horizon << ",";

        oss << "\"series\":[";
        for (std::size_t i = 0; i < f.series.size(); ++i)
        {
            if (i) oss << ",";
            oss << forecastResultToJson(f.series[i]);
        }
        oss << "],";

        oss << "\"topAnomalies\":[";
        for (std::size_t i = 0; i < f.topAnomalies.size(); ++i)
        {
            if (i) oss << ",";
            oss << forecastResultToJson(f.topAnomalies[i]);
        }
        oss << "]";

        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::selectionToJson(const core::SelectionDecision& s) const
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"agents\":" << stringArray(s.agents) << ",";
        oss << "\"threshold\":" << s.threshold << ",";
        oss << "\"learned\":" << (s.learned ? "true" : "false") << ",";
        oss << "\"keywords\":" << stringArray(s.keywords) << ",";
        oss << "\"suggestion\":";
        if (s.suggestion)
        {
            const auto& sug = *s.suggestion;
            oss << "{\"agents\":" << stringArray(std::vector<std::string>(sug.agents.begin(), sug.agents.end()))
                << ",\"confidence\":" << number(sug.confidence, 3)
                << ",\"basedOn\":" << sug.basedOn << "}";
        }
        else
        {
            oss << "null";
        }
        oss << "}";
        return oss.str();
    }

    // ---- Private helpers ----

    std::vector<std::pair<std::string, std::string>> JsonReporter::sections() const
    {
        std::vector<std::pair<std::string, std::string>> out;
        out.emplace_back("incidentId", quoted(m_report.incidentId));
        out.emplace_back("processedAt", quoted(Utils::toIso8601Utc(m_report.processedAt)));
        out.emplace_back("metricCount", std::to_string(m_report.metricCount));
        out.emplace_back("overview", overviewToJson(m_report.overview));
        out.emplace_back("correlation", correlationToJson(m_report.correlation));
        out.emplace_back("forecast", m_report.forecast ? forecastToJson(*m_report.forecast) : "null");
        out.emplace_back("selection", selectionToJson(m_report.selection));
        return out;
    }

    void JsonReporter::writeCompactJson(std::ostream& output) const
    {
        const auto parts = sections();
        output << "{";
        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            if (i) output << ",";
            output << quoted(parts[i].first) << ":" << parts[i].second;
        }
        output << "}";
    }

    void JsonReporter::writePrettyJson(std::ostream& output) const
    {
        const auto parts = sections();
        output << "{\n";
        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            output << "  " << quoted(parts[i].first) << ": " << parts[i].second;
            output << (i + 1 < parts.size() ? "," : "") << "\n";
        }
        output << "}\n";
    }

    std::string JsonReporter::escapeJsonString(const std::string& str)
    {
        std::string result;
        result.reserve(str.size() + 8);

        for (unsigned char uc : str)
        {
            const char c = static_cast<char>(uc);
            switch (c)
            {
                case '"': result += "\\\""; break;
                case '\\': result += "\\\\"; break;
                case '\b': result += "\\b"; break;
                case '\f': result += "\\f"; break;
                case '\n': result += "\\n"; break;
                case '\r': result += "\\r"; break;
                case '\t': result += "\\t"; break;
                default:
                    if (uc < 0x20)
                    {
                        result += "\\u";
                        result += toHex(static_cast<unsigned int>(uc), 4);
                    }
                    else
                    {
                        result += c;
                    }
                    break;
            }
        }
        return result;
    }

    std::string JsonReporter::quoted(const std::string& str)
    {
        return "\"" + escapeJsonString(str) + "\"";
    }

    std::string JsonReporter::stringArray(const std::vector<std::string>& values)
    {
        std::string out = "[";
        for (std::size_t i = 0; i < values.size(); ++i)
        {
            if (i) out += ",";
            out += quoted(values[i]);
        }
        out += "]";
        return out;
    }

    std::string JsonReporter::number(double value, int precision)
    {
        // JSON has no NaN/Infinity.
        if (!std::isfinite(value))
            return "null";

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << value;
        return oss.str();
    }

    std::string JsonReporter::toHex(unsigned int value, std::size_t width)
    {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setfill('0') << std::setw(static_cast<int>(width))
            << value;
        return oss.str();
    }

} // namespace Report
} // namespace OpsTriage
