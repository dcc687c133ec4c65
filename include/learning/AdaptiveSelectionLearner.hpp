#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/AlertRecord.hpp"
#include "core/EngineConfig.hpp"
#include "core/Selection.hpp"
#include "learning/SelectionStore.hpp"

namespace OpsTriage
{
    namespace Learning
    {
        /**
         * AdaptiveSelectionLearner
         *
         * Responsibilities:
         *  - Bucket incidents by a canonical keyword signature
         *  - Record which specialist set handled each incident and how well it went
         *  - Suggest the best historical specialist set for a signature
         *  - Nudge the engagement threshold within fixed bounds
         *
         * Design notes:
         *  - The bucket table lives behind SelectionStore and is only reached
         *    through recordOutcome(), suggest() and adjustThreshold()
         *  - Thread-safe as long as the store is; the learner itself holds no
         *    mutable state
         *  - Missing history is a normal empty result, never an error
         */
        class AdaptiveSelectionLearner
        {
        public:
            AdaptiveSelectionLearner(std::shared_ptr<SelectionStore> store,
                                     core::LearnerConfig config = {});

            /**
             * Signature keywords for an incident: each alert contributes the
             * first title word longer than three characters that is not a
             * stop-word; at most three keywords, lowercased, in alert order.
             */
            static std::vector<std::string> extractKeywords(const std::vector<core::AlertRecord>& alerts);

            /// First three keywords, lowercased, sorted and joined with '_'.
            static std::string canonicalSignature(const std::vector<std::string>& keywords);

            /// Throws core::MalformedInputError for quality outside [0, 1].
            void recordOutcome(const std::vector<std::string>& keywords,
                               const core::AgentSet& agentsUsed,
                               double outcomeQuality);

            std::optional<core::SelectionSuggestion> suggest(const std::vector<std::string>& keywords) const;

            /**
             * Best-averaging agent set once the bucket holds at least
             * minObservations entries, or nullopt when the best average falls
             * below the confidence floor. Ties keep the first-seen set.
             */
            std::optional<core::SelectionSuggestion> suggest(const std::vector<std::string>& keywords,
                                                             std::size_t minObservations) const;

            int adjustThreshold(const std::vector<std::string>& keywords, int baseThreshold) const;

            /// Always within [threshold floor, threshold ceiling].
            int adjustThreshold(const std::vector<std::string>& keywords,
                                int baseThreshold,
                                std::size_t minObservations) const;

            const core::LearnerConfig& config() const noexcept { return m_config; }
            const SelectionStore& store() const noexcept { return *m_store; }

        private:
            std::shared_ptr<SelectionStore> m_store;
            core::LearnerConfig             m_config;
        };

    } // namespace Learning
} // namespace OpsTriage
