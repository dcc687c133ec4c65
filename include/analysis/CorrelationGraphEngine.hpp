#pragma once

#include <string>
#include <vector>

#include "core/AlertRecord.hpp"
#include "core/CorrelationResult.hpp"
#include "core/EngineConfig.hpp"

namespace OpsTriage
{
    namespace Analysis
    {
        /**
         * CorrelationGraphEngine
         *
         * Responsibilities:
         *  - Score every unordered pair of alerts in a batch (host, time, title keywords)
         *  - Build an undirected similarity graph from pairs above the edge threshold
         *  - Select the dominant connected component as the incident cluster
         *  - Explain the outcome (cluster size, primary alert, time span)
         *
         * Design notes:
         *  - Stateless after construction; correlate() is reentrant and may run
         *    on any number of threads concurrently
         *  - Timestamps are resolved strictly: an unparseable timestamp raises
         *    core::MalformedInputError instead of defaulting
         *  - Component ties go to the cluster whose earliest alert is earliest,
         *    then to the lexically smallest primary id
         */
        class CorrelationGraphEngine
        {
        public:
            /// Score and contributing signals for one pair of alerts.
            struct PairScore
            {
                double                   score = 0.0;
                std::vector<std::string> signals;
            };

            explicit CorrelationGraphEngine(core::CorrelationConfig config = {});

            /**
             * Correlate a batch of alerts into one dominant incident cluster.
             *
             * Fewer than two alerts short-circuit with confidence 1.0.
             * Throws core::MalformedInputError for empty required fields,
             * duplicate ids or unparseable timestamps.
             */
            core::CorrelationResult correlate(const std::vector<core::AlertRecord>& alerts) const;

            /**
             * Pairwise similarity as the sum of independent signals:
             * same host, timestamps within the proximity window (inclusive),
             * and shared lowercase title tokens (capped).
             */
            PairScore pairSimilarity(const core::AlertRecord& a, const core::AlertRecord& b) const;

            /// Batch overview: counts per severity, hosts, sources, time window.
            core::AlertOverview summarizeAlerts(const std::vector<core::AlertRecord>& alerts) const;

            const core::CorrelationConfig& config() const noexcept { return m_config; }

        private:
            PairScore scoreResolved(const core::AlertRecord& a, Utils::TimePoint ta,
                                    const core::AlertRecord& b, Utils::TimePoint tb) const;

            static void validateBatch(const std::vector<core::AlertRecord>& alerts);

        private:
            core::CorrelationConfig m_config;
        };

    } // namespace Analysis
} // namespace OpsTriage
