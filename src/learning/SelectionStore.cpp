#include "learning/SelectionStore.hpp"

#include <algorithm>
#include <functional>

#include "utils/Logger.hpp"

namespace OpsTriage
{
    namespace Learning
    {
        using namespace core;
        using namespace Utils;

        InMemorySelectionStore::InMemorySelectionStore(std::size_t maxObservationsPerSignature)
            : m_maxPerSignature(maxObservationsPerSignature)
        {
        }

        InMemorySelectionStore::Shard& InMemorySelectionStore::shardFor(const std::string& signature)
        {
            return m_shards[std::hash<std::string>{}(signature) % kShardCount];
        }

        const InMemorySelectionStore::Shard& InMemorySelectionStore::shardFor(const std::string& signature) const
        {
            return m_shards[std::hash<std::string>{}(signature) % kShardCount];
        }

        std::vector<SelectionObservation> InMemorySelectionStore::history(const std::string& signature) const
        {
            const Shard& shard = shardFor(signature);
            std::lock_guard<std::mutex> lock(shard.mutex);

            const auto it = shard.buckets.find(signature);
            if (it == shard.buckets.end())
                return {};
            return std::vector<SelectionObservation>(it->second.begin(), it->second.end());
        }

        void InMemorySelectionStore::append(const std::string& signature, SelectionObservation observation)
        {
            Shard& shard = shardFor(signature);
            std::size_t evicted = 0;
            {
                std::lock_guard<std::mutex> lock(shard.mutex);
                auto& bucket = shard.buckets[signature];
                bucket.push_back(std::move(observation));

                if (m_maxPerSignature > 0)
                {
                    while (bucket.size() > m_maxPerSignature)
                    {
                        bucket.pop_front();
                        ++evicted;
                    }
                }
            }

            if (evicted > 0)
            {
                getLogger().log(LogLevel::TRACE, "Learner",
                                "evicted " + std::to_string(evicted) + " observation(s) from '" + signature + "'");
            }
        }

        std::vector<std::string> InMemorySelectionStore::signatures() const
        {
            std::vector<std::string> out;
            for (const auto& shard : m_shards)
            {
                std::lock_guard<std::mutex> lock(shard.mutex);
                for (const auto& [signature, bucket] : shard.buckets)
                    out.push_back(signature);
            }
            std::sort(out.begin(), out.end());
            return out;
        }

        std::size_t InMemorySelectionStore::observationCount() const
        {
            std::size_t total = 0;
            for (const auto& shard : m_shards)
            {
                std::lock_guard<std::mutex> lock(shard.mutex);
                for (const auto& [signature, bucket] : shard.buckets)
                    total += bucket.size();
            }
            return total;
        }

    } // namespace Learning
} // namespace OpsTriage
