#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "core/IncidentReport.hpp"
#include "utils/TimeUtils.hpp"

namespace OpsTriage
{
    namespace Report
    {
        /**
         * ConsoleReporter
         *
         * Responsibilities:
         *  - Human-readable incident summary for terminals
         *  - Color-coded severity and anomaly indicators (if terminal supports)
         *  - Tabular forecast and anomaly listing
         *
         * Design notes:
         *  - Colors are auto-detected from stdout being a TTY and can be forced off
         *  - Output stream is injectable (not owned) so reports can be captured
         */
        class ConsoleReporter
        {
        public:
            enum class Verbosity
            {
                QUIET,    // Incident line only
                NORMAL,   // Overview, correlation, top anomalies, selection
                VERBOSE   // Adds edges and every forecast series
            };

            explicit ConsoleReporter(Verbosity verbosity = Verbosity::NORMAL,
                                     std::ostream* output = &std::cout);

            ConsoleReporter(const ConsoleReporter&) = default;
            ConsoleReporter& operator=(const ConsoleReporter&) = default;

            void generateReport(const core::IncidentReport& report);

            /// One-line incident summary.
            void printSummary(const core::IncidentReport& report);

            void flush();

            void setVerbosity(Verbosity level) noexcept;
            void setEnableColors(bool enable) noexcept;

        private:
            /// Color for a 0..1 intensity (ANSI/VT100 sequences).
            static const char* getSeverityColor(double intensity);
            static void printSeverityBar(std::ostream& os, double intensity, int width = 20);

            void printOverview(const core::AlertOverview& overview);
            void printCorrelation(const core::CorrelationResult& correlation);
            void printForecast(const core::ForecastSummary& forecast);
            void printSelection(const core::SelectionDecision& selection);
            void printForecastTable(const std::vector<core::ForecastResult>& rows);

            std::string colored(const std::string& text, double intensity) const;

        private:
            Verbosity     m_verbosity;
            bool          m_colorsEnabled;
            std::ostream* m_output;
        };

    } // namespace Report
} // namespace OpsTriage
