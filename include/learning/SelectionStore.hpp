#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/Selection.hpp"

namespace OpsTriage
{
    namespace Learning
    {
        /**
         * SelectionStore
         *
         * Keyed history of selection outcomes (signature -> observations).
         * Implementations must make append() atomic with respect to history():
         * a reader sees either the list before or after an append, never a
         * partially grown one.
         */
        class SelectionStore
        {
        public:
            virtual ~SelectionStore() = default;

            /// Snapshot of the observations for a signature, oldest first.
            virtual std::vector<core::SelectionObservation> history(const std::string& signature) const = 0;

            /// Append one observation, creating the bucket on first use.
            virtual void append(const std::string& signature, core::SelectionObservation observation) = 0;

            /// All known signatures, sorted.
            virtual std::vector<std::string> signatures() const = 0;

            /// Total observations across all buckets.
            virtual std::size_t observationCount() const = 0;
        };

        /**
         * InMemorySelectionStore
         *
         * Responsibilities:
         *  - Hold signature buckets in process memory
         *  - Bound each bucket when a per-signature cap is configured
         *
         * Design notes:
         *  - Buckets are spread over a fixed number of mutex-guarded shards
         *    (hash of the signature), so unrelated incidents rarely contend
         *  - With a cap, the oldest observations are evicted first; a cap of
         *    0 keeps every observation
         */
        class InMemorySelectionStore : public SelectionStore
        {
        public:
            static constexpr std::size_t kShardCount = 16;

            explicit InMemorySelectionStore(std::size_t maxObservationsPerSignature = 0);

            InMemorySelectionStore(const InMemorySelectionStore&) = delete;
            InMemorySelectionStore& operator=(const InMemorySelectionStore&) = delete;

            std::vector<core::SelectionObservation> history(const std::string& signature) const override;
            void append(const std::string& signature, core::SelectionObservation observation) override;
            std::vector<std::string> signatures() const override;
            std::size_t observationCount() const override;

            std::size_t maxObservationsPerSignature() const noexcept { return m_maxPerSignature; }

        private:
            struct Shard
            {
                mutable std::mutex mutex;
                std::unordered_map<std::string, std::deque<core::SelectionObservation>> buckets;
            };

            Shard& shardFor(const std::string& signature);
            const Shard& shardFor(const std::string& signature) const;

        private:
            std::array<Shard, kShardCount> m_shards;
            std::size_t                    m_maxPerSignature;
        };

    } // namespace Learning
} // namespace OpsTriage
