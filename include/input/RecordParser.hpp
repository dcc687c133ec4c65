#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/AlertRecord.hpp"
#include "core/MetricPoint.hpp"
#include "input/FileReader.hpp"

namespace OpsTriage
{
    namespace Input
    {
        /**
         * RecordParser
         *
         * Responsibilities:
         *  - Turn JSON-lines text into AlertRecord and MetricPoint values.
         *  - Reject records with missing or invalid required fields.
         *
         * Design notes:
         *  - Stateless (thread-safe); hand-rolled top-level field extraction,
         *    no JSON library. Nested objects and arrays are skipped over.
         *  - Timestamps are kept as raw text; consumers decide how strictly
         *    to resolve them.
         *  - Structural problems raise core::MalformedInputError naming the field.
         */
        class RecordParser
        {
        public:
            RecordParser() = default;

            /**
             * Parse one alert object.
             *
             * Required: alert_id (or id), title, host, severity, timestamp.
             * Optional: description, source.
             */
            core::AlertRecord parseAlertLine(std::string_view rawLine) const;

            /// Required: host, metric_name (or metric), numeric value. Optional: timestamp.
            core::MetricPoint parseMetricLine(std::string_view rawLine) const;

            /**
             * Read every alert from a file. Blank lines and lines starting with
             * '#' are skipped. The first malformed line aborts with an error
             * whose message carries the line number.
             */
            std::vector<core::AlertRecord> readAlerts(FileReader &reader) const;

            /**
             * Read every metric from a file. Malformed lines are logged with
             * their line number and skipped; skippedOut receives the count.
             */
            std::vector<core::MetricPoint> readMetrics(FileReader &reader, std::size_t *skippedOut = nullptr) const;

            /**
             * Value for a top-level key: unescaped string contents for string
             * values, trimmed raw text for anything else. Only keys are matched,
             * never string values or nested members. nullopt when the key is
             * absent, the value is JSON null, or the object is malformed
             * before the key is reached.
             */
            static std::optional<std::string> extractField(std::string_view json, std::string_view key);

        private:
            static std::string_view objectBody(std::string_view rawLine);
            static std::string requireField(std::string_view json,
                                            std::string_view key,
                                            std::string_view fallbackKey,
                                            std::string_view recordId);
        };

    } // namespace Input
} // namespace OpsTriage
