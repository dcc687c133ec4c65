#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/EngineConfig.hpp"
#include "core/ForecastResult.hpp"
#include "core/MetricPoint.hpp"

namespace OpsTriage
{
    namespace Analysis
    {
        /**
         * ExponentialForecaster
         *
         * Responsibilities:
         *  - Fit a Holt linear (level + trend) smoother to an ordered series
         *  - Project a straight-line forecast from the final level/trend pair
         *  - Score the latest residual against the residual history (z-score)
         *  - Group raw metric points by (host, metric) and rank the anomalies
         *
         * Design notes:
         *  - O(n) per series, no seasonality term
         *  - The one-step fitted value is the post-update level + trend
         *  - Batch grouping resolves timestamps leniently: an unparseable
         *    timestamp is logged and treated as "now", unlike correlation
         *  - Series shorter than min_points are skipped, never reported
         */
        class ExponentialForecaster
        {
        public:
            /// Throws core::MalformedInputError for alpha/beta outside (0, 1].
            explicit ExponentialForecaster(core::ForecastConfig config = {});

            /**
             * Holt linear fit.
             *
             * Empty series: zero level/trend, `horizon` zeros.
             * Single point: that value repeated, one zero residual.
             */
            static core::HoltFit fit(const std::vector<double>& series,
                                     std::size_t horizon,
                                     double alpha,
                                     double beta);

            /// Fit with the configured smoothing constants.
            core::HoltFit fit(const std::vector<double>& series, std::size_t horizon) const;

            /// z-score of the latest residual; 0 without residual variance.
            static double anomalyScore(const core::HoltFit& fit) noexcept;

            /**
             * Forecast one already-ordered series.
             * Throws core::InsufficientDataError below the configured min_points.
             */
            core::ForecastResult forecastSeries(const std::string& host,
                                                const std::string& metric,
                                                const std::vector<double>& values) const;

            core::ForecastSummary summarize(const std::vector<core::MetricPoint>& points) const;

            core::ForecastSummary summarize(const std::vector<core::MetricPoint>& points,
                                            std::size_t horizon,
                                            std::size_t minPoints) const;

            const core::ForecastConfig& config() const noexcept { return m_config; }

        private:
            core::ForecastResult forecastSeries(const std::string& host,
                                                const std::string& metric,
                                                const std::vector<double>& values,
                                                std::size_t horizon,
                                                std::size_t minPoints) const;

        private:
            core::ForecastConfig m_config;
        };

    } // namespace Analysis
} // namespace OpsTriage
