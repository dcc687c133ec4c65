#include "core/EngineConfig.hpp"

#include <cmath>
#include <set>
#include <sstream>

#include "core/Errors.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/Stats.hpp"

namespace core
{
    using namespace OpsTriage;

    namespace
    {
        const std::set<std::string>& knownKeys()
        {
            static const std::set<std::string> keys = {
                "correlation.edge_threshold",
                "correlation.same_host_weight",
                "correlation.time_proximity_weight",
                "correlation.keyword_weight_per_token",
                "correlation.keyword_weight_cap",
                "correlation.time_window_secs",
                "forecast.alpha",
                "forecast.beta",
                "forecast.horizon",
                "forecast.min_points",
                "forecast.display_cap",
                "forecast.top_anomalies",
                "learner.suggest_min_observations",
                "learner.threshold_min_observations",
                "learner.suggestion_confidence_floor",
                "learner.high_quality_mark",
                "learner.low_quality_mark",
                "learner.threshold_floor",
                "learner.threshold_ceiling",
                "learner.threshold_step",
                "learner.max_observations_per_signature",
                "selector.base_threshold",
                "selector.override_confidence",
                "pipeline.assumed_outcome_quality",
                "log.level",
                "log.file",
            };
            return keys;
        }

        [[noreturn]] void reject(const std::string& key, const std::string& why)
        {
            throw MalformedInputError(key, "config '" + key + "': " + why);
        }

        double readDouble(const Utils::ConfigLoader& loader, const std::string& key, double current)
        {
            if (!loader.hasKey(key))
                return current;
            const auto v = loader.getDouble(key);
            if (!v || !std::isfinite(*v))
                reject(key, "expected a number");
            return *v;
        }

        long long readInt(const Utils::ConfigLoader& loader, const std::string& key, long long current)
        {
            if (!loader.hasKey(key))
                return current;
            const auto v = loader.getInt(key);
            if (!v)
                reject(key, "expected an integer");
            return *v;
        }

        std::size_t readCount(const Utils::ConfigLoader& loader, const std::string& key, std::size_t current)
        {
            const long long v = readInt(loader, key, static_cast<long long>(current));
            if (v < 0)
                reject(key, "must not be negative");
            return static_cast<std::size_t>(v);
        }

        // Thresholds and steps live on the 0..100 relevance scale.
        int readScore(const Utils::ConfigLoader& loader, const std::string& key, int current)
        {
            const long long v = readInt(loader, key, current);
            if (v < 0 || v > 100)
                reject(key, "must lie in [0, 100]");
            return static_cast<int>(v);
        }

        void requireScore(const std::string& key, int v)
        {
            if (v < 0 || v > 100)
                reject(key, "must lie in [0, 100]");
        }

        void requireUnit(const std::string& key, double v)
        {
            if (!(v >= 0.0 && v <= 1.0))
                reject(key, "must lie in [0, 1]");
        }

        void requireNonNegative(const std::string& key, double v)
        {
            if (!(v >= 0.0) || !std::isfinite(v))
                reject(key, "must be a non-negative number");
        }
    } // anonymous namespace

    void EngineConfig::validate() const
    {
        requireNonNegative("correlation.edge_threshold", correlation.edgeThreshold);
        requireNonNegative("correlation.same_host_weight", correlation.sameHostWeight);
        requireNonNegative("correlation.time_proximity_weight", correlation.timeProximityWeight);
        requireNonNegative("correlation.keyword_weight_per_token", correlation.keywordWeightPerToken);
        requireNonNegative("correlation.keyword_weight_cap", correlation.keywordWeightCap);
        requireNonNegative("correlation.time_window_secs", correlation.timeWindowSeconds);

        Utils::Stats::validateSmoothing("forecast.alpha", forecast.alpha);
        Utils::Stats::validateSmoothing("forecast.beta", forecast.beta);
        if (forecast.minPoints == 0)
            reject("forecast.min_points", "must be at least 1");

        if (learner.suggestMinObservations == 0)
            reject("learner.suggest_min_observations", "must be at least 1");
        if (learner.thresholdMinObservations == 0)
            reject("learner.threshold_min_observations", "must be at least 1");
        requireUnit("learner.suggestion_confidence_floor", learner.suggestionConfidenceFloor);
        requireUnit("learner.high_quality_mark", learner.highQualityMark);
        requireUnit("learner.low_quality_mark", learner.lowQualityMark);
        if (learner.lowQualityMark >= learner.highQualityMark)
            reject("learner.low_quality_mark", "must be below learner.high_quality_mark");
        requireScore("learner.threshold_floor", learner.thresholdFloor);
        requireScore("learner.threshold_ceiling", learner.thresholdCeiling);
        requireScore("learner.threshold_step", learner.thresholdStep);
        if (learner.thresholdFloor > learner.thresholdCeiling)
            reject("learner.threshold_floor", "must not exceed learner.threshold_ceiling");

        requireScore("selector.base_threshold", selector.baseThreshold);
        requireUnit("selector.override_confidence", selector.overrideConfidence);

        requireUnit("pipeline.assumed_outcome_quality", pipeline.assumedOutcomeQuality);

        if (!Utils::parseLogLevel(logLevel))
            reject("log.level", "unknown level '" + logLevel + "'");
    }

    EngineConfig loadEngineConfig(const Utils::ConfigLoader& loader)
    {
        EngineConfig cfg;

        for (const auto& key : loader.keys())
        {
            if (knownKeys().count(key) == 0)
                Utils::getLogger().log(Utils::LogLevel::WARN, "Config", "ignoring unknown key '" + key + "'");
        }

        auto& c = cfg.correlation;
        c.edgeThreshold         = readDouble(loader, "correlation.edge_threshold", c.edgeThreshold);
        c.sameHostWeight        = readDouble(loader, "correlation.same_host_weight", c.sameHostWeight);
        c.timeProximityWeight   = readDouble(loader, "correlation.time_proximity_weight", c.timeProximityWeight);
        c.keywordWeightPerToken = readDouble(loader, "correlation.keyword_weight_per_token", c.keywordWeightPerToken);
        c.keywordWeightCap      = readDouble(loader, "correlation.keyword_weight_cap", c.keywordWeightCap);
        c.timeWindowSeconds     = readDouble(loader, "correlation.time_window_secs", c.timeWindowSeconds);

        auto& f = cfg.forecast;
        f.alpha        = readDouble(loader, "forecast.alpha", f.alpha);
        f.beta         = readDouble(loader, "forecast.beta", f.beta);
        f.horizon      = readCount(loader, "forecast.horizon", f.horizon);
        f.minPoints    = readCount(loader, "forecast.min_points", f.minPoints);
        f.displayCap   = readCount(loader, "forecast.display_cap", f.displayCap);
        f.topAnomalies = readCount(loader, "forecast.top_anomalies", f.topAnomalies);

        auto& l = cfg.learner;
        l.suggestMinObservations      = readCount(loader, "learner.suggest_min_observations", l.suggestMinObservations);
        l.thresholdMinObservations    = readCount(loader, "learner.threshold_min_observations", l.thresholdMinObservations);
        l.suggestionConfidenceFloor   = readDouble(loader, "learner.suggestion_confidence_floor", l.suggestionConfidenceFloor);
        l.highQualityMark             = readDouble(loader, "learner.high_quality_mark", l.highQualityMark);
        l.lowQualityMark              = readDouble(loader, "learner.low_quality_mark", l.lowQualityMark);
        l.thresholdFloor              = readScore(loader, "learner.threshold_floor", l.thresholdFloor);
        l.thresholdCeiling            = readScore(loader, "learner.threshold_ceiling", l.thresholdCeiling);
        l.thresholdStep               = readScore(loader, "learner.threshold_step", l.thresholdStep);
        l.maxObservationsPerSignature = readCount(loader, "learner.max_observations_per_signature", l.maxObservationsPerSignature);

        auto& s = cfg.selector;
        s.baseThreshold      = readScore(loader, "selector.base_threshold", s.baseThreshold);
        s.overrideConfidence = readDouble(loader, "selector.override_confidence", s.overrideConfidence);

        cfg.pipeline.assumedOutcomeQuality =
            readDouble(loader, "pipeline.assumed_outcome_quality", cfg.pipeline.assumedOutcomeQuality);

        cfg.logLevel = loader.getStringOr("log.level", cfg.logLevel);
        cfg.logFile  = loader.getStringOr("log.file", cfg.logFile);

        cfg.validate();
        return cfg;
    }

} // namespace core
