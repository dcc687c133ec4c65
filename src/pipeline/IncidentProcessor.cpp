#include "pipeline/IncidentProcessor.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <utility>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace OpsTriage
{
    namespace Pipeline
    {
        using namespace core;
        using namespace Utils;

        namespace
        {
            EngineConfig validated(EngineConfig config)
            {
                config.validate();
                return config;
            }

            // FNV-1a, stable across platforms and runs.
            std::uint32_t fnv1a(const std::string& text) noexcept
            {
                std::uint32_t hash = 2166136261u;
                for (unsigned char c : text)
                {
                    hash ^= c;
                    hash *= 16777619u;
                }
                return hash;
            }
        } // anonymous namespace

        IncidentProcessor::IncidentProcessor(EngineConfig config)
            : IncidentProcessor(config,
                                std::make_shared<Learning::InMemorySelectionStore>(
                                    config.learner.maxObservationsPerSignature))
        {
        }

        IncidentProcessor::IncidentProcessor(EngineConfig config, std::shared_ptr<Learning::SelectionStore> store)
            : m_config(validated(std::move(config))),
              m_store(std::move(store)),
              m_correlation(m_config.correlation),
              m_forecaster(m_config.forecast),
              m_learner(std::make_shared<Learning::AdaptiveSelectionLearner>(m_store, m_config.learner)),
              m_selector(m_learner, m_config.selector)
        {
            getLogger().log(LogLevel::INFO, "Pipeline", "IncidentProcessor initialized");
        }

        std::string IncidentProcessor::incidentIdFor(const std::vector<AlertRecord>& alerts)
        {
            std::vector<std::string> ids;
            ids.reserve(alerts.size());
            for (const auto& alert : alerts)
                ids.push_back(alert.id());
            std::sort(ids.begin(), ids.end());

            std::string material;
            for (const auto& id : ids)
            {
                material += id;
                material += '\n';
            }

            std::ostringstream oss;
            oss << "INC-" << std::hex << std::uppercase << std::setw(8) << std::setfill('0') << fnv1a(material);
            return oss.str();
        }

        IncidentReport IncidentProcessor::process(const std::vector<AlertRecord>& alerts,
                                                  const std::vector<MetricPoint>& metrics,
                                                  const std::optional<Learning::RelevanceScores>& scores) const
        {
            IncidentReport report;
            report.incidentId = incidentIdFor(alerts);
            report.processedAt = now();
            report.metricCount = metrics.size();

            report.correlation = m_correlation.correlate(alerts);
            report.overview = m_correlation.summarizeAlerts(alerts);

            if (!metrics.empty())
                report.forecast = m_forecaster.summarize(metrics);

            const Learning::RelevanceScores relevance =
                scores ? *scores : Learning::AgentSelector::heuristicScores(alerts, metrics);
            report.selection = m_selector.select(alerts, relevance);

            getLogger().log(LogLevel::INFO, "Pipeline",
                            report.incidentId + ": " + std::to_string(alerts.size()) + " alert(s), " +
                            std::to_string(report.correlation.suppressedCount) + " suppressed, " +
                            std::to_string(report.selection.agents.size()) + " agent(s) engaged");
            return report;
        }

        void IncidentProcessor::recordOutcome(const IncidentReport& report, std::optional<double> outcomeQuality)
        {
            const double quality = outcomeQuality.value_or(m_config.pipeline.assumedOutcomeQuality);
            const AgentSet agents(report.selection.agents.begin(), report.selection.agents.end());

            m_learner->recordOutcome(report.selection.keywords, agents, quality);

            getLogger().log(LogLevel::DEBUG, "Pipeline",
                            report.incidentId + ": recorded outcome quality " + std::to_string(quality));
        }

    } // namespace Pipeline
} // namespace OpsTriage
