#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analysis/CorrelationGraphEngine.hpp"
#include "analysis/ExponentialForecaster.hpp"
#include "core/EngineConfig.hpp"
#include "core/IncidentReport.hpp"
#include "learning/AdaptiveSelectionLearner.hpp"
#include "learning/AgentSelector.hpp"
#include "learning/SelectionStore.hpp"

namespace OpsTriage
{
    namespace Pipeline
    {
        /**
         * IncidentProcessor
         *
         * Responsibilities:
         *  - Run correlation, forecasting and specialist selection for one incident
         *  - Feed the observed (or assumed) outcome back into the learner
         *
         * Design notes:
         *  - Correlation and forecasting are pure; the only shared state is the
         *    selection store, so process()/recordOutcome() may run concurrently
         *    for different incidents
         *  - Malformed alerts propagate as core::MalformedInputError
         */
        class IncidentProcessor
        {
        public:
            /// Uses an InMemorySelectionStore sized from the learner config.
            explicit IncidentProcessor(core::EngineConfig config = {});

            IncidentProcessor(core::EngineConfig config, std::shared_ptr<Learning::SelectionStore> store);

            /**
             * Analyze one incident. Without supplied relevance scores the
             * keyword heuristic is used.
             */
            core::IncidentReport process(const std::vector<core::AlertRecord>& alerts,
                                         const std::vector<core::MetricPoint>& metrics,
                                         const std::optional<Learning::RelevanceScores>& scores = std::nullopt) const;

            /// Record the outcome of a processed incident; quality defaults to the assumed value.
            void recordOutcome(const core::IncidentReport& report,
                               std::optional<double> outcomeQuality = std::nullopt);

            /// "INC-" + 8 hex digits derived from the sorted alert ids.
            static std::string incidentIdFor(const std::vector<core::AlertRecord>& alerts);

            const core::EngineConfig& config() const noexcept { return m_config; }
            const Learning::AdaptiveSelectionLearner& learner() const noexcept { return *m_learner; }

        private:
            core::EngineConfig                                  m_config;
            std::shared_ptr<Learning::SelectionStore>           m_store;
            Analysis::CorrelationGraphEngine                    m_correlation;
            Analysis::ExponentialForecaster                     m_forecaster;
            std::shared_ptr<Learning::AdaptiveSelectionLearner> m_learner;
            Learning::AgentSelector                             m_selector;
        };

    } // namespace Pipeline
} // namespace OpsTriage
