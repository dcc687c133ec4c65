#include "analysis/CorrelationGraphEngine.hpp"

#include <algorithm>
#include <numeric>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace OpsTriage
{
    namespace Analysis
    {
        using namespace core;
        using namespace Utils;

        namespace
        {
            // Disjoint-set forest over alert indices.
            class UnionFind
            {
            public:
                explicit UnionFind(std::size_t n)
                    : m_parent(n), m_size(n, 1)
                {
                    std::iota(m_parent.begin(), m_parent.end(), std::size_t{0});
                }

                std::size_t find(std::size_t x)
                {
                    while (m_parent[x] != x)
                    {
                        m_parent[x] = m_parent[m_parent[x]];
                        x = m_parent[x];
                    }
                    return x;
                }

                void unite(std::size_t a, std::size_t b)
                {
                    a = find(a);
                    b = find(b);
                    if (a == b)
                        return;
                    if (m_size[a] < m_size[b])
                        std::swap(a, b);
                    m_parent[b] = a;
                    m_size[a] += m_size[b];
                }

            private:
                std::vector<std::size_t> m_parent;
                std::vector<std::size_t> m_size;
            };

            std::set<std::string> titleTokens(const std::string& title)
            {
                const auto tokens = tokenizeLower(title);
                return std::set<std::string>(tokens.begin(), tokens.end());
            }

            std::string formatScore(double score)
            {
                std::ostringstream oss;
                oss.precision(2);
                oss << std::fixed << score;
                return oss.str();
            }
        } // anonymous namespace

        CorrelationGraphEngine::CorrelationGraphEngine(CorrelationConfig config)
            : m_config(config)
        {
            getLogger().log(LogLevel::DEBUG, "Correlation",
                            "CorrelationGraphEngine initialized (edge threshold: " +
                            formatScore(m_config.edgeThreshold) + ", window: " +
                            formatScore(m_config.timeWindowSeconds) + "s)");
        }

        void CorrelationGraphEngine::validateBatch(const std::vector<AlertRecord>& alerts)
        {
            std::unordered_set<std::string> seen;
            seen.reserve(alerts.size());

            for (const auto& alert : alerts)
            {
                if (trim(alert.id()).empty())
                    throw MalformedInputError("id", "alert with empty id");
                if (trim(alert.title()).empty())
                    throw MalformedInputError("title", alert.id(), "alert '" + alert.id() + "' has an empty title");
                if (trim(alert.host()).empty())
                    throw MalformedInputError("host", alert.id(), "alert '" + alert.id() + "' has an empty host");
                if (!seen.insert(alert.id()).second)
                    throw MalformedInputError("id", alert.id(), "duplicate alert id '" + alert.id() + "' in batch");
            }
        }

        CorrelationGraphEngine::PairScore CorrelationGraphEngine::pairSimilarity(const AlertRecord& a,
                                                                                 const AlertRecord& b) const
        {
            return scoreResolved(a, a.timestamp().resolveStrict(a.id()),
                                 b, b.timestamp().resolveStrict(b.id()));
        }

        CorrelationGraphEngine::PairScore CorrelationGraphEngine::scoreResolved(const AlertRecord& a, TimePoint ta,
                                                                                const AlertRecord& b, TimePoint tb) const
        {
            PairScore result;

            if (a.host() == b.host())
            {
                result.score += m_config.sameHostWeight;
                result.signals.emplace_back("same_host");
            }

            if (absDiffSeconds(ta, tb) <= m_config.timeWindowSeconds)
            {
                result.score += m_config.timeProximityWeight;
                result.signals.emplace_back("time_proximity");
            }

            const auto tokensA = titleTokens(a.title());
            const auto tokensB = titleTokens(b.title());
            std::size_t overlap = 0;
            for (const auto& token : tokensA)
            {
                if (tokensB.count(token) != 0)
                    ++overlap;
            }
            if (overlap > 0)
            {
                result.score += std::min(m_config.keywordWeightCap,
                                         static_cast<double>(overlap) * m_config.keywordWeightPerToken);
                result.signals.emplace_back("keyword_match");
            }

            return result;
        }

        CorrelationResult CorrelationGraphEngine::correlate(const std::vector<AlertRecord>& alerts) const
        {
            validateBatch(alerts);

            // Resolve every timestamp up front so malformed input fails before any scoring.
            std::vector<TimePoint> times;
            times.reserve(alerts.size());
            for (const auto& alert : alerts)
                times.push_back(alert.timestamp().resolveStrict(alert.id()));

            CorrelationResult result;

            if (alerts.empty())
            {
                result.confidence = 1.0;
                result.rootCause = "No alerts";
                result.reasoning.emplace_back("Only one alert, no correlation needed");
                return result;
            }

            if (alerts.size() == 1)
            {
                result.primaryAlertId = alerts.front().id();
                result.confidence = 1.0;
                result.rootCause = alerts.front().title();
                result.reasoning.emplace_back("Only one alert, no correlation needed");
                return result;
            }

            const std::size_t n = alerts.size();
            UnionFind components(n);

            for (std::size_t i = 0; i < n; ++i)
            {
                for (std::size_t j = i + 1; j < n; ++j)
                {
                    PairScore pair = scoreResolved(alerts[i], times[i], alerts[j], times[j]);
                    if (pair.score > m_config.edgeThreshold)
                    {
                        components.unite(i, j);
                        result.edges.push_back(CorrelationEdge{alerts[i].id(), alerts[j].id(),
                                                               pair.score, std::move(pair.signals)});
                    }
                }
            }

            if (result.edges.empty())
            {
                result.primaryAlertId = alerts.front().id();
                result.confidence = 0.3;
                result.rootCause = "No clear correlation detected";
                result.reasoning.emplace_back("Alerts appear unrelated");
                getLogger().log(LogLevel::DEBUG, "Correlation",
                                "no pair of " + std::to_string(n) + " alerts cleared the edge threshold");
                return result;
            }

            // Group members per root, each group in timestamp order (input order on ties).
            std::unordered_map<std::size_t, std::vector<std::size_t>> groups;
            for (std::size_t i = 0; i < n; ++i)
                groups[components.find(i)].push_back(i);

            const auto byTime = [&times](std::size_t x, std::size_t y) { return times[x] < times[y]; };

            const std::vector<std::size_t>* best = nullptr;
            for (auto& [root, members] : groups)
            {
                std::stable_sort(members.begin(), members.end(), byTime);

                if (best == nullptr)
                {
                    best = &members;
                    continue;
                }
                if (members.size() != best->size())
                {
                    if (members.size() > best->size())
                        best = &members;
                    continue;
                }

                const std::size_t candidate = members.front();
                const std::size_t current = best->front();
                if (times[candidate] < times[current] ||
                    (times[candidate] == times[current] && alerts[candidate].id() < alerts[current].id()))
                {
                    best = &members;
                }
            }

            const AlertRecord& primary = alerts[best->front()];
            result.primaryAlertId = primary.id();
            for (std::size_t k = 1; k < best->size(); ++k)
                result.relatedAlertIds.push_back(alerts[(*best)[k]].id());

            result.confidence = 0.85;
            result.rootCause = primary.title();
            result.suppressedCount = result.relatedAlertIds.size();

            const std::int64_t span = diffSeconds(times[best->front()], times[best->back()]);
            result.reasoning.push_back("Identified cluster of " + std::to_string(best->size()) + " related alerts");
            result.reasoning.push_back("Primary alert: " + primary.title() + " on " + primary.host());
            result.reasoning.push_back("Time span: " + std::to_string(span) + "s");

            getLogger().log(LogLevel::DEBUG, "Correlation",
                            "clustered " + std::to_string(best->size()) + " of " + std::to_string(n) +
                            " alerts around '" + primary.id() + "'");
            return result;
        }

        AlertOverview CorrelationGraphEngine::summarizeAlerts(const std::vector<AlertRecord>& alerts) const
        {
            AlertOverview overview;
            overview.totalAlerts = alerts.size();

            std::set<std::string> hosts;
            std::set<std::string> sources;

            for (const auto& alert : alerts)
            {
                ++overview.severityBreakdown[alert.severity()];
                hosts.insert(alert.host());
                if (alert.source() && !alert.source()->empty())
                    sources.insert(*alert.source());

                const auto when = alert.timestamp().resolve();
                if (!when)
                    continue;
                if (!overview.windowStart || *when < *overview.windowStart)
                    overview.windowStart = *when;
                if (!overview.windowEnd || *when > *overview.windowEnd)
                    overview.windowEnd = *when;
            }

            overview.affectedHosts.assign(hosts.begin(), hosts.end());
            overview.sources.assign(sources.begin(), sources.end());
            return overview;
        }

    } // namespace Analysis
} // namespace OpsTriage
