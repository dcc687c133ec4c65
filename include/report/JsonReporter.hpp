#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "core/IncidentReport.hpp"
#include "utils/TimeUtils.hpp"

namespace OpsTriage
{
    namespace Report
    {
        /**
         * JsonReporter
         *
         * Responsibilities:
         *  - Serialize an IncidentReport for machine consumption
         *  - Proper JSON escaping and number formatting
         *  - Compact and pretty-print modes
         *
         * Design notes:
         *  - No external dependencies; RFC 8259 output
         *  - Absent values (no primary alert, no metrics) are written as null
         *  - Forecast values are rounded for display (2 dp), trend to 4 dp
         *    and anomaly scores to 3 dp
         */
        class JsonReporter
        {
        public:
            enum class PrettyPrint
            {
                COMPACT,  // Single line, minimal whitespace
                PRETTY    // One top-level section per line
            };

            explicit JsonReporter(PrettyPrint pretty = PrettyPrint::COMPACT);

            JsonReporter(const JsonReporter&) = default;
            JsonReporter& operator=(const JsonReporter&) = default;

            /// Capture the report to be written.
            void generateReport(const core::IncidentReport& report);

            void writeJson(std::ostream& output) const;

            std::string getJsonString() const;

            std::string overviewToJson(const core::AlertOverview& overview) const;
            std::string correlationToJson(const core::CorrelationResult& correlation) const;
            std::string forecastToJson(const core::ForecastSummary& forecast) const;
            std::string selectionToJson(const core::SelectionDecision& selection) const;

            void setPrettyPrint(PrettyPrint mode) noexcept;

        private:
            /// JSON escaping for strings (RFC 8259)
            static std::string escapeJsonString(const std::string& str);

            static std::string quoted(const std::string& str);
            static std::string stringArray(const std::vector<std::string>& values);
            static std::string number(double value, int precision);
            static std::string forecastResultToJson(const core::ForecastResult& result);

            /// Top-level (key, already-serialized value) pairs in output order.
            std::vector<std::pair<std::string, std::string>> sections() const;

            void writeCompactJson(std::ostream& output) const;
            void writePrettyJson(std::ostream& output) const;

            static std::string toHex(unsigned int value, std::size_t width);

        private:
            core::IncidentReport m_report;
            PrettyPrint          m_prettyPrint;
        };

    } // namespace Report
} // namespace OpsTriage
