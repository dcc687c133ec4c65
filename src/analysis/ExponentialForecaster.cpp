#include "analysis/ExponentialForecaster.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include "utils/Stats.hpp"

namespace OpsTriage
{
    namespace Analysis
    {
        using namespace core;
        using namespace Utils;

        ExponentialForecaster::ExponentialForecaster(ForecastConfig config)
            : m_config(config)
        {
            Stats::validateSmoothing("alpha", m_config.alpha);
            Stats::validateSmoothing("beta", m_config.beta);

            getLogger().log(LogLevel::DEBUG, "Forecast",
                            "ExponentialForecaster initialized (horizon: " + std::to_string(m_config.horizon) +
                            ", min points: " + std::to_string(m_config.minPoints) + ")");
        }

        HoltFit ExponentialForecaster::fit(const std::vector<double>& series,
                                           std::size_t horizon,
                                           double alpha,
                                           double beta)
        {
            Stats::validateSmoothing("alpha", alpha);
            Stats::validateSmoothing("beta", beta);

            HoltFit out;

            if (series.empty())
            {
                out.forecast.assign(horizon, 0.0);
                return out;
            }

            if (series.size() == 1)
            {
                out.level = series.front();
                out.fitted.push_back(series.front());
                out.residuals.push_back(0.0);
                out.forecast.assign(horizon, series.front());
                return out;
            }

            double level = series[0];
            double trend = series[1] - series[0];

            out.fitted.reserve(series.size());
            out.residuals.reserve(series.size());

            // First observation seeds the level and is its own fitted value.
            out.fitted.push_back(level);
            out.residuals.push_back(series[0] - level);

            for (std::size_t i = 1; i < series.size(); ++i)
            {
                const double actual = series[i];
                const double lastLevel = level;

                level = alpha * actual + (1.0 - alpha) * (level + trend);
                trend = beta * (level - lastLevel) + (1.0 - beta) * trend;

                const double prediction = level + trend;
                out.fitted.push_back(prediction);
                out.residuals.push_back(actual - prediction);
            }

            out.level = level;
            out.trend = trend;
            out.forecast.reserve(horizon);
            for (std::size_t k = 1; k <= horizon; ++k)
                out.forecast.push_back(level + static_cast<double>(k) * trend);

            return out;
        }

        HoltFit ExponentialForecaster::fit(const std::vector<double>& series, std::size_t horizon) const
        {
            return fit(series, horizon, m_config.alpha, m_config.beta);
        }

        double ExponentialForecaster::anomalyScore(const HoltFit& fit) noexcept
        {
            if (fit.residuals.empty())
                return 0.0;
            return Stats::zScore(fit.residuals.back(), fit.residuals);
        }

        ForecastResult ExponentialForecaster::forecastSeries(const std::string& host,
                                                             const std::string& metric,
                                                             const std::vector<double>& values) const
        {
            return forecastSeries(host, metric, values, m_config.horizon, m_config.minPoints);
        }

        ForecastResult ExponentialForecaster::forecastSeries(const std::string& host,
                                                             const std::string& metric,
                                                             const std::vector<double>& values,
                                                             std::size_t horizon,
                                                             std::size_t minPoints) const
        {
            if (values.size() < minPoints)
                throw InsufficientDataError(values.size(), minPoints);

            const HoltFit holt = fit(values, horizon);

            ForecastResult result;
            result.host = host;
            result.metric = metric;
            result.lastValue = values.empty() ? 0.0 : values.back();
            result.trend = holt.trend;
            result.latestResidual = holt.residuals.empty() ? 0.0 : holt.residuals.back();
            result.anomalyScore = anomalyScore(holt);

            const std::size_t shown = std::min(horizon, m_config.displayCap);
            result.forecast.assign(holt.forecast.begin(),
                                   holt.forecast.begin() + static_cast<std::ptrdiff_t>(shown));
            return result;
        }

        ForecastSummary ExponentialForecaster::summarize(const std::vector<MetricPoint>& points) const
        {
            return summarize(points, m_config.horizon, m_config.minPoints);
        }

        ForecastSummary ExponentialForecaster::summarize(const std::vector<MetricPoint>& points,
                                                         std::size_t horizon,
                                                         std::size_t minPoints) const
        {
            ForecastSummary summary;
            summary.generatedAt = now();
            summary.horizon = horizon;

            using SeriesKey = std::pair<std::string, std::string>;
            using Sample = std::pair<TimePoint, double>;

            std::vector<SeriesKey> order;
            std::map<SeriesKey, std::vector<Sample>> grouped;

            for (const auto& point : points)
            {
                TimePoint when = summary.generatedAt;
                if (const auto resolved = point.timestamp().resolve())
                {
                    when = *resolved;
                }
                else
                {
                    getLogger().log(LogLevel::WARN, "Forecast",
                                    "unparseable timestamp '" + point.timestamp().text() + "' for " +
                                    point.host() + "/" + point.metricName() + ", using current time");
                }

                SeriesKey key{point.host(), point.metricName()};
                auto it = grouped.find(key);
                if (it == grouped.end())
                {
                    order.push_back(key);
                    it = grouped.emplace(std::move(key), std::vector<Sample>{}).first;
                }
                it->second.emplace_back(when, point.value());
            }

            for (const auto& key : order)
            {
                auto& samples = grouped[key];
                std::stable_sort(samples.begin(), samples.end(),
                                 [](const Sample& a, const Sample& b) { return a.first < b.first; });

                std::vector<double> values;
                values.reserve(samples.size());
                for (const auto& sample : samples)
                    values.push_back(sample.second);

                try
                {
                    summary.series.push_back(forecastSeries(key.first, key.second, values, horizon, minPoints));
                }
                catch (const InsufficientDataError& e)
                {
                    getLogger().log(LogLevel::DEBUG, "Forecast",
                                    "skipping " + key.first + "/" + key.second + ": " + e.what());
                }
            }

            summary.topAnomalies = summary.series;
            std::stable_sort(summary.topAnomalies.begin(), summary.topAnomalies.end(),
                             [](const ForecastResult& a, const ForecastResult& b)
                             {
                                 return a.anomalyScore > b.anomalyScore;
                             });
            if (summary.topAnomalies.size() > m_config.topAnomalies)
                summary.topAnomalies.resize(m_config.topAnomalies);

            getLogger().log(LogLevel::DEBUG, "Forecast",
                            "forecast " + std::to_string(summary.series.size()) + " of " +
                            std::to_string(order.size()) + " series");
            return summary;
        }

    } // namespace Analysis
} // namespace OpsTriage
