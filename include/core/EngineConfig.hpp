// Tunables for every analytics component, with their documented defaults.
//
// Components receive their section by value at construction; nothing reads
// configuration from globals.

#ifndef CORE_ENGINE_CONFIG_HPP
#define CORE_ENGINE_CONFIG_HPP

#include <cstddef>
#include <string>

namespace OpsTriage::Utils { class ConfigLoader; }

namespace core
{

struct CorrelationConfig
{
    double edgeThreshold         = 0.5;   ///< strict: an edge needs score > threshold
    double sameHostWeight        = 0.4;
    double timeProximityWeight   = 0.3;
    double keywordWeightPerToken = 0.1;
    double keywordWeightCap      = 0.3;
    double timeWindowSeconds     = 60.0;  ///< inclusive
};

struct ForecastConfig
{
    double      alpha        = 0.4;
    double      beta         = 0.2;
    std::size_t horizon      = 12;
    std::size_t minPoints    = 5;
    std::size_t displayCap   = 8;
    std::size_t topAnomalies = 5;
};

struct LearnerConfig
{
    std::size_t suggestMinObservations      = 3;
    std::size_t thresholdMinObservations    = 5;
    double      suggestionConfidenceFloor   = 0.7;
    double      highQualityMark             = 0.75;
    double      lowQualityMark              = 0.4;
    int         thresholdFloor              = 50;
    int         thresholdCeiling            = 85;
    int         thresholdStep               = 5;
    std::size_t maxObservationsPerSignature = 0;   ///< 0 = unbounded
};

struct SelectorConfig
{
    int    baseThreshold      = 60;
    double overrideConfidence = 0.85;
};

struct PipelineConfig
{
    double assumedOutcomeQuality = 0.8;
};

struct EngineConfig
{
    CorrelationConfig correlation;
    ForecastConfig    forecast;
    LearnerConfig     learner;
    SelectorConfig    selector;
    PipelineConfig    pipeline;
    std::string       logLevel = "INFO";
    std::string       logFile;

    /// Throws MalformedInputError naming the first invalid field.
    void validate() const;
};

/**
 * @brief Build an EngineConfig from loaded key/value pairs.
 *
 * Missing keys keep their defaults. Present but unparseable or out-of-range
 * values raise MalformedInputError. Unknown keys are logged and ignored.
 */
EngineConfig loadEngineConfig(const OpsTriage::Utils::ConfigLoader& loader);

} // namespace core

#endif // CORE_ENGINE_CONFIG_HPP
