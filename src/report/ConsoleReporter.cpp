#include "report/ConsoleReporter.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

#include "utils/StringUtils.hpp"

#if defined(_WIN32)
  #include <io.h>      // _isatty, _fileno
#else
  #include <unistd.h>  // isatty, fileno
#endif

namespace OpsTriage
{
namespace Report
{
    namespace
    {
        bool stdoutIsTty() noexcept
        {
        #if defined(_WIN32)
            return _isatty(_fileno(stdout)) != 0;
        #else
            return ::isatty(::fileno(stdout)) != 0;
        #endif
        }

        double severityIntensity(core::Severity s) noexcept
        {
            return static_cast<double>(static_cast<int>(s)) / static_cast<double>(static_cast<int>(core::Severity::Critical));
        }

        // z-scores of 4 and above render as fully intense.
        double anomalyIntensity(double z) noexcept
        {
            return std::clamp(z / 4.0, 0.0, 1.0);
        }

        std::string fixed(double value, int precision)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(precision) << value;
            return oss.str();
        }
    } // namespace

    ConsoleReporter::ConsoleReporter(Verbosity verbosity, std::ostream* output)
        : m_verbosity(verbosity),
          m_colorsEnabled(false),
          m_output(output ? output : &std::cout)
    {
        m_colorsEnabled = (m_output == &std::cout) && stdoutIsTty();
    }

    void ConsoleReporter::generateReport(const core::IncidentReport& report)
    {
        if (m_verbosity == Verbosity::QUIET)
        {
            printSummary(report);
            return;
        }

        *m_output << "\n=== INCIDENT " << report.incidentId << " ===\n";
        *m_output << "Processed:      " << Utils::formatTimestamp(report.processedAt) << "\n";
        *m_output << "Metric points:  " << report.metricCount << "\n\n";

        printOverview(report.overview);
        printCorrelation(report.correlation);
        if (report.forecast)
            printForecast(*report.forecast);
        printSelection(report.selection);

        *m_output << "=== END INCIDENT ===\n\n";
        flush();
    }

    void ConsoleReporter::printSummary(const core::IncidentReport& report)
    {
        *m_output << report.incidentId << ": "
                  << report.overview.totalAlerts << " alerts, "
                  << report.correlation.suppressedCount << " suppressed, root cause: "
                  << report.correlation.rootCause << "\n";
        flush();
    }

    void ConsoleReporter::flush()
    {
        m_output->flush();
    }

    void ConsoleReporter::setVerbosity(Verbosity level) noexcept
    {
        m_verbosity = level;
    }

    void ConsoleReporter::setEnableColors(bool enable) noexcept
    {
        m_colorsEnabled = enable;
    }

    // ---- Sections ----

    void ConsoleReporter::printOverview(const core::AlertOverview& overview)
    {
        *m_output << "Alerts:         " << overview.totalAlerts << "\n";
        for (auto it = overview.severityBreakdown.rbegin(); it != overview.severityBreakdown.rend(); ++it)
        {
            std::ostringstream label;
            label << std::left << std::setw(10) << core::severityToString(it->first);
            *m_output << "  " << colored(label.str(), severityIntensity(it->first)) << it->second << "\n";
        }
        *m_output << "Hosts:          " << Utils::join(overview.affectedHosts, ", ") << "\n";
        if (!overview.sources.empty())
            *m_output << "Sources:        " << Utils::join(overview.sources, ", ") << "\n";
        if (overview.windowStart && overview.windowEnd)
        {
            *m_output << "Window:         " << Utils::formatTimestamp(*overview.windowStart)
                      << " -> " << Utils::formatTimestamp(*overview.windowEnd) << "\n";
        }
        *m_output << "\n";
    }

    void ConsoleReporter::printCorrelation(const core::CorrelationResult& c)
    {
        *m_output << "Correlation\n" << std::string(70, '-') << "\n";
        *m_output << "Primary alert:  " << c.primaryAlertId.value_or("(none)") << "\n";
        *m_output << "Root cause:     " << c.rootCause << "\n";
        *m_output << "Confidence:     ";
        printSeverityBar(*m_output, c.confidence, 20);
        *m_output << " " << fixed(c.confidence, 2) << "\n";
        if (!c.relatedAlertIds.empty())
            *m_output << "Related:        " << Utils::join(c.relatedAlertIds, ", ") << "\n";
        *m_output << "Suppressed:     " << c.suppressedCount << "\n";
        for (const auto& line : c.reasoning)
            *m_output << "  - " << line << "\n";

        if (m_verbosity >= Verbosity::VERBOSE && !c.edges.empty())
        {
            *m_output << "Edges:\n";
            for (const auto& e : c.edges)
            {
                *m_output << "  " << e.a << " <-> " << e.b << "  " << fixed(e.score, 2)
                          << "  (" << Utils::join(e.signals, ", ") << ")\n";
            }
        }
        *m_output << "\n";
    }

    void ConsoleReporter::printForecast(const core::ForecastSummary& f)
    {
        *m_output << "Forecast (horizon " << f.horizon << ", " << f.series.size() << " series)\n"
                  << std::string(70, '-') << "\n";

        if (f.series.empty())
        {
            *m_output << "No series with enough data points.\n\n";
            return;
        }

        if (m_verbosity >= Verbosity::VERBOSE)
        {
            printForecastTable(f.series);
            *m_output << "\n";
        }

        *m_output << "Top anomalies\n";
        printForecastTable(f.topAnomalies);
        *m_output << "\n";
    }

    void ConsoleReporter::printForecastTable(const std::vector<core::ForecastResult>& rows)
    {
        const int colSeries = 32;
        const int colNum    = 10;

        *m_output << std::left << std::setw(colSeries) << "Series"
                  << std::right << std::setw(colNum) << "Last"
                  << std::setw(colNum) << "Trend"
                  << std::setw(colNum) << "Score" << "  Next\n";

        for (const auto& r : rows)
        {
            std::vector<std::string> next;
            for (std::size_t i = 0; i < std::min<std::size_t>(3, r.forecast.size()); ++i)
                next.push_back(fixed(r.forecast[i], 2));

            std::ostringstream score;
            score << std::right << std::setw(colNum) << fixed(r.anomalyScore, 3);

            *m_output << std::left << std::setw(colSeries) << (r.host + "/" + r.metric)
                      << std::right << std::setw(colNum) << fixed(r.lastValue, 2)
                      << std::setw(colNum) << fixed(r.trend, 4)
                      << colored(score.str(), anomalyIntensity(r.anomalyScore))
                      << "  " << Utils::join(next, " ") << "\n";
        }
    }

    void ConsoleReporter::printSelection(const core::SelectionDecision& s)
    {
        *m_output << "Specialists\n" << std::string(70, '-') << "\n";
        *m_output << "Engaged:        " << Utils::join(s.agents, ", ") << "\n";
        if (s.learned)
        {
            *m_output << "Source:         learned pattern";
            if (s.suggestion)
                *m_output << " (" << fixed(s.suggestion->confidence, 2) << " over "
                          << s.suggestion->basedOn << " incidents)";
            *m_output << "\n";
        }
        else
        {
            *m_output << "Threshold:      " << s.threshold << "\n";
        }
        if (!s.keywords.empty())
            *m_output << "Signature:      " << Utils::join(s.keywords, " ") << "\n";
        *m_output << "\n";
    }

    // ---- Private helpers ----

    const char* ConsoleReporter::getSeverityColor(double intensity)
    {
        if (intensity >= 0.75) return "\033[91m"; // bright red
        if (intensity >= 0.50) return "\033[93m"; // yellow
        if (intensity >= 0.25) return "\033[33m"; // dark yellow
        return "\033[97m"; // white
    }

    void ConsoleReporter::printSeverityBar(std::ostream& os, double intensity, int width)
    {
        if (width <= 0)
            return;

        const int full  = std::clamp(static_cast<int>(intensity * width + 0.5), 0, width);
        const int empty = width - full;
        os << std::string(full, '=') << std::string(empty, '.');
    }

    std::string ConsoleReporter::colored(const std::string& text, double intensity) const
    {
        if (!m_colorsEnabled)
            return text;
        return std::string(getSeverityColor(intensity)) + text + "\033[0m";
    }

} // namespace Report
} // namespace OpsTriage
