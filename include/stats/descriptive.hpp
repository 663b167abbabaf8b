/**
 * @file descriptive.hpp
 * @brief Sample moments, quantiles and histograms over plain vectors.
 *
 * Inputs are already-cleaned samples (no missing values). Functions that
 * need a minimum sample size throw InsufficientDataError below it.
 */

#ifndef RISKCORE_STATS_DESCRIPTIVE_HPP
#define RISKCORE_STATS_DESCRIPTIVE_HPP

#include <cstddef>
#include <vector>

namespace riskcore
{
    namespace stats
    {

        /**
         * @struct HistogramData
         * @brief Equal-width histogram: bin_edges has counts.size() + 1 entries.
         */
        struct HistogramData
        {
            std::vector<double> bin_edges;
            std::vector<int> counts;
        };

        /**
         * @brief Arithmetic mean.
         * @throws InsufficientDataError if values is empty.
         */
        double mean(const std::vector<double> &values);

        /**
         * @brief Sample variance with ddof = 1.
         * @throws InsufficientDataError if fewer than 2 values.
         */
        double sample_variance(const std::vector<double> &values);

        /**
         * @brief Sample standard deviation with ddof = 1.
         * @throws InsufficientDataError if fewer than 2 values.
         */
        double sample_std(const std::vector<double> &values);

        /**
         * @brief Skewness, biased (population moment) estimator.
         * @return 0 for an empty sample or zero variance.
         */
        double skewness(const std::vector<double> &values);

        /**
         * @brief Excess kurtosis, biased (population moment) estimator.
         * @return 0 for an empty sample or zero variance.
         */
        double excess_kurtosis(const std::vector<double> &values);

        /**
         * @brief Linear-interpolation quantile (type 7).
         * @param values Sample (need not be sorted)
         * @param q Probability in [0, 1]
         * @throws InsufficientDataError if values is empty
         * @throws InvalidParameterError if q is outside [0, 1]
         */
        double quantile(const std::vector<double> &values, double q);

        /**
         * @brief Weighted linear-interpolation quantile.
         *
         * Values are sorted with their weights (negative weights clipped to
         * zero). Sorted position k is placed at cumulative probability
         * (S_k - w_k) / (S_total - w_last), where S_k is the cumulative
         * weight through k, and the quantile is interpolated linearly
         * between positions. With equal weights this reduces to quantile().
         *
         * Falls back to the unweighted quantile if weights are missing,
         * mismatched in size, or sum to zero.
         *
         * @throws InsufficientDataError if values is empty
         * @throws InvalidParameterError if q is outside [0, 1]
         */
        double weighted_quantile(const std::vector<double> &values,
                                 const std::vector<double> &weights,
                                 double q);

        /**
         * @brief Exponentially decaying observation weights.
         *
         * Observation i (0 = oldest) of n receives (1 - lambda) * lambda^(n-1-i),
         * normalised so the weights sum to 1.
         *
         * @throws InvalidParameterError if lambda is not in (0, 1)
         */
        std::vector<double> ewma_weights(size_t n, double lambda);

        /**
         * @brief Equal-width histogram between the sample min and max.
         *
         * The last bin is closed on the right. A degenerate range is widened
         * to [min - 0.5, max + 0.5]. An empty sample gives an empty histogram.
         */
        HistogramData build_histogram(const std::vector<double> &values, int bins = 50);

    } // namespace stats
} // namespace riskcore

#endif // RISKCORE_STATS_DESCRIPTIVE_HPP
