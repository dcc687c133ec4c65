#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/AlertRecord.hpp"
#include "core/EngineConfig.hpp"
#include "core/MetricPoint.hpp"
#include "core/Selection.hpp"
#include "learning/AdaptiveSelectionLearner.hpp"

namespace OpsTriage
{
    namespace Learning
    {
        /// Relevance score (0..100) per specialist name.
        using RelevanceScores = std::map<std::string, int>;

        /**
         * AgentSelector
         *
         * Decides which specialists engage on an incident. A confident learned
         * suggestion wins outright; otherwise specialists whose relevance
         * score reaches the (learned, bounded) threshold are engaged alongside
         * the Orchestrator.
         */
        class AgentSelector
        {
        public:
            static constexpr const char* kOrchestrator  = "Orchestrator";
            static constexpr const char* kAlertOps      = "AlertOps";
            static constexpr const char* kPredictiveOps = "PredictiveOps";
            static constexpr const char* kPatchOps      = "PatchOps";
            static constexpr const char* kTaskOps       = "TaskOps";

            AgentSelector(std::shared_ptr<const AdaptiveSelectionLearner> learner,
                          core::SelectorConfig config = {});

            core::SelectionDecision select(const std::vector<core::AlertRecord>& alerts,
                                           const RelevanceScores& scores) const;

            core::SelectionDecision select(const std::vector<core::AlertRecord>& alerts,
                                           const RelevanceScores& scores,
                                           int baseThreshold) const;

            /**
             * Keyword heuristic used when no upstream scores are supplied.
             *
             * AlertOps and PredictiveOps get fixed scores from alert/metric
             * counts; PatchOps and TaskOps score 5 per matching alert and 3 per
             * matching metric name (first ten), capped at 40.
             */
            static RelevanceScores heuristicScores(const std::vector<core::AlertRecord>& alerts,
                                                   const std::vector<core::MetricPoint>& metrics);

            /// Capability keyword relevance for one specialist, 0..40.
            static int keywordRelevance(const std::string& agent,
                                        const std::vector<core::AlertRecord>& alerts,
                                        const std::vector<core::MetricPoint>& metrics);

        private:
            std::shared_ptr<const AdaptiveSelectionLearner> m_learner;
            core::SelectorConfig                            m_config;
        };

    } // namespace Learning
} // namespace OpsTriage
