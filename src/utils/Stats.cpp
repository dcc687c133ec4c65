#include "utils/Stats.hpp"

#include <cmath>
#include <numeric>
#include <sstream>
#include <string>

#include "core/Errors.hpp"

namespace OpsTriage
{
    namespace Utils
    {
        namespace Stats
        {
            double mean(const std::vector<double>& values) noexcept
            {
                if (values.empty())
                    return 0.0;
                const double sum = std::accumulate(values.begin(), values.end(), 0.0);
                return sum / static_cast<double>(values.size());
            }

            double populationVariance(const std::vector<double>& values) noexcept
            {
                if (values.empty())
                    return 0.0;

                const double m = mean(values);
                double acc = 0.0;
                for (double v : values)
                {
                    const double d = v - m;
                    acc += d * d;
                }
                return acc / static_cast<double>(values.size());
            }

            double populationStddev(const std::vector<double>& values) noexcept
            {
                const double var = populationVariance(values);
                return var > 0.0 ? std::sqrt(var) : 0.0;
            }

            double zScore(double latest, const std::vector<double>& history) noexcept
            {
                if (history.empty())
                    return 0.0;

                const double sd = populationStddev(history);
                if (sd == 0.0 || !std::isfinite(sd))
                    return 0.0;

                return std::abs(latest - mean(history)) / sd;
            }

            void validateSmoothing(std::string_view name, double value)
            {
                if (std::isfinite(value) && value > 0.0 && value <= 1.0)
                    return;

                std::ostringstream oss;
                oss << "smoothing constant " << name << "=" << value << " outside (0, 1]";
                throw core::MalformedInputError(std::string(name), oss.str());
            }
        } // namespace Stats

    } // namespace Utils
} // namespace OpsTriage
