// Forecast records produced by the exponential-smoothing forecaster.

#ifndef CORE_FORECAST_RESULT_HPP
#define CORE_FORECAST_RESULT_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "utils/TimeUtils.hpp"

namespace core
{

/**
 * @brief Raw Holt linear fit over one series.
 *
 * fitted and residuals have one entry per observation; forecast has exactly
 * `horizon` entries.
 */
struct HoltFit
{
    double              level = 0.0;
    double              trend = 0.0;
    std::vector<double> fitted;
    std::vector<double> forecast;
    std::vector<double> residuals;
};

/// Per-series summary; `forecast` is the display slice, not the full horizon.
struct ForecastResult
{
    std::string         host;
    std::string         metric;
    double              lastValue = 0.0;
    double              trend = 0.0;
    std::vector<double> forecast;
    double              anomalyScore = 0.0;
    double              latestResidual = 0.0;
};

struct ForecastSummary
{
    OpsTriage::Utils::TimePoint generatedAt{};
    std::size_t                 horizon = 0;
    std::vector<ForecastResult> series;        ///< first-seen group order
    std::vector<ForecastResult> topAnomalies;  ///< anomalyScore desc, capped
};

} // namespace core

#endif // CORE_FORECAST_RESULT_HPP
