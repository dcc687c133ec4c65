#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace OpsTriage
{
    namespace Utils
    {
        /**
         * Stats
         *
         * Shared numeric helpers for the forecaster and anomaly scoring.
         * Population (not sample) moments: the residual history of a fit is
         * the whole population being scored against.
         */
        namespace Stats
        {
            /// Arithmetic mean; 0 for an empty range.
            double mean(const std::vector<double>& values) noexcept;

            /// Population variance (divide by n); 0 for an empty range.
            double populationVariance(const std::vector<double>& values) noexcept;

            double populationStddev(const std::vector<double>& values) noexcept;

            /**
             * |latest - mean(history)| / stddev(history).
             *
             * Always >= 0. Returns 0 when history is empty or has zero
             * variance.
             */
            double zScore(double latest, const std::vector<double>& history) noexcept;

            /**
             * Validate a smoothing constant.
             *
             * Throws core::MalformedInputError(name) unless value is finite
             * and 0 < value <= 1.
             */
            void validateSmoothing(std::string_view name, double value);

            /// Clamp to [lo, hi].
            template <typename T>
            constexpr T clampToRange(T value, T lo, T hi) noexcept
            {
                return value < lo ? lo : (hi < value ? hi : value);
            }
        } // namespace Stats

    } // namespace Utils
} // namespace OpsTriage
