/**
 * @file descriptive.cpp
 * @brief Implementation of sample statistics, quantiles and histograms.
 */

#include "stats/descriptive.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace riskcore
{
    namespace stats
    {

        namespace
        {
            void validate_probability(double q)
            {
                if (!(q >= 0.0 && q <= 1.0))
                {
                    throw InvalidParameterError(
                        "Quantile must be in [0, 1], got: " + std::to_string(q));
                }
            }

            /**
             * @brief Linear interpolation over sorted values at fractional position h.
             */
            double interpolate_sorted(const std::vector<double> &sorted, double h)
            {
                size_t lower = static_cast<size_t>(std::floor(h));
                if (lower + 1 >= sorted.size())
                {
                    return sorted.back();
                }
                double frac = h - static_cast<double>(lower);
                return sorted[lower] + frac * (sorted[lower + 1] - sorted[lower]);
            }

            void central_moments(const std::vector<double> &values, double &m2, double &m3, double &m4)
            {
                double mu = mean(values);
                m2 = 0.0;
                m3 = 0.0;
                m4 = 0.0;
                for (double x : values)
                {
                    double d = x - mu;
                    double d2 = d * d;
                    m2 += d2;
                    m3 += d2 * d;
                    m4 += d2 * d2;
                }
                double n = static_cast<double>(values.size());
                m2 /= n;
                m3 /= n;
                m4 /= n;
            }
        } // anonymous namespace

        // ===================================================================
        // Moments
        // ===================================================================

        double mean(const std::vector<double> &values)
        {
            if (values.empty())
            {
                throw InsufficientDataError("Cannot compute mean of an empty sample");
            }
            return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
        }

        double sample_variance(const std::vector<double> &values)
        {
            if (values.size() < 2)
            {
                throw InsufficientDataError(
                    "Sample variance needs at least 2 observations, got: " + std::to_string(values.size()));
            }
            double mu = mean(values);
            double sum_sq = 0.0;
            for (double x : values)
            {
                double diff = x - mu;
                sum_sq += diff * diff;
            }
            return sum_sq / static_cast<double>(values.size() - 1);
        }

        double sample_std(const std::vector<double> &values)
        {
            return std::sqrt(sample_variance(values));
        }

        double skewness(const std::vector<double> &values)
        {
            if (values.empty())
            {
                return 0.0;
            }
            double m2, m3, m4;
            central_moments(values, m2, m3, m4);
            if (m2 < 1e-18)
            {
                return 0.0;
            }
            return m3 / std::pow(m2, 1.5);
        }

        double excess_kurtosis(const std::vector<double> &values)
        {
            if (values.empty())
            {
                return 0.0;
            }
            double m2, m3, m4;
            central_moments(values, m2, m3, m4);
            if (m2 < 1e-18)
            {
                return 0.0;
            }
            return m4 / (m2 * m2) - 3.0;
        }

        // ===================================================================
        // Quantiles
        // ===================================================================

        double quantile(const std::vector<double> &values, double q)
        {
            if (values.empty())
            {
                throw InsufficientDataError("Cannot compute quantile of an empty sample");
            }
            validate_probability(q);

            std::vector<double> sorted(values);
            std::sort(sorted.begin(), sorted.end());

            double h = q * static_cast<double>(sorted.size() - 1);
            return interpolate_sorted(sorted, h);
        }

        double weighted_quantile(const std::vector<double> &values,
                                 const std::vector<double> &weights,
                                 double q)
        {
            if (values.empty())
            {
                throw InsufficientDataError("Cannot compute quantile of an empty sample");
            }
            validate_probability(q);

            if (weights.size() != values.size())
            {
                return quantile(values, q);
            }

            const size_t n = values.size();
            std::vector<size_t> order(n);
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(),
                             [&values](size_t a, size_t b)
                             { return values[a] < values[b]; });

            std::vector<double> sorted(n);
            std::vector<double> w(n);
            for (size_t k = 0; k < n; ++k)
            {
                sorted[k] = values[order[k]];
                w[k] = std::max(0.0, weights[order[k]]);
            }

            double total = std::accumulate(w.begin(), w.end(), 0.0);
            double denom = total - w.back();
            if (!(total > 0.0) || !(denom > 0.0))
            {
                return quantile(values, q);
            }

            // Plotting positions: first observation at 0, last at 1
            std::vector<double> cdf(n);
            double running = 0.0;
            for (size_t k = 0; k < n; ++k)
            {
                running += w[k];
                cdf[k] = std::min(1.0, (running - w[k]) / denom);
            }

            if (q <= cdf.front())
            {
                return sorted.front();
            }
            if (q >= cdf.back())
            {
                return sorted.back();
            }

            // First position whose cdf exceeds q; interpolate from its predecessor
            auto it = std::upper_bound(cdf.begin(), cdf.end(), q);
            size_t upper = static_cast<size_t>(std::distance(cdf.begin(), it));
            size_t lower = upper - 1;

            double span = cdf[upper] - cdf[lower];
            if (span <= 0.0)
            {
                return sorted[upper];
            }
            double frac = (q - cdf[lower]) / span;
            return sorted[lower] + frac * (sorted[upper] - sorted[lower]);
        }

        std::vector<double> ewma_weights(size_t n, double lambda)
        {
            if (!(lambda > 0.0 && lambda < 1.0))
            {
                throw InvalidParameterError(
                    "EWMA lambda must be in (0, 1), got: " + std::to_string(lambda));
            }

            std::vector<double> weights(n);
            double total = 0.0;
            for (size_t i = 0; i < n; ++i)
            {
                double age = static_cast<double>(n - 1 - i);
                weights[i] = (1.0 - lambda) * std::pow(lambda, age);
                total += weights[i];
            }
            if (total > 0.0)
            {
                for (double &w : weights)
                {
                    w /= total;
                }
            }
            return weights;
        }

        // ===================================================================
        // Histogram
        // ===================================================================

        HistogramData build_histogram(const std::vector<double> &values, int bins)
        {
            if (bins < 1)
            {
                throw InvalidParameterError(
                    "Expected positive value for parameter 'bins', got: " + std::to_string(bins));
            }

            HistogramData hist;
            if (values.empty())
            {
                return hist;
            }

            auto minmax = std::minmax_element(values.begin(), values.end());
            double lo = *minmax.first;
            double hi = *minmax.second;
            if (lo == hi)
            {
                lo -= 0.5;
                hi += 0.5;
            }

            hist.bin_edges.resize(static_cast<size_t>(bins) + 1);
            double width = (hi - lo) / static_cast<double>(bins);
            for (int b = 0; b <= bins; ++b)
            {
                hist.bin_edges[static_cast<size_t>(b)] = lo + width * static_cast<double>(b);
            }
            hist.bin_edges.back() = hi;

            hist.counts.assign(static_cast<size_t>(bins), 0);
            for (double x : values)
            {
                int idx = static_cast<int>(std::floor((x - lo) / width));
                idx = std::min(std::max(idx, 0), bins - 1);
                // Keep the bin consistent with the stored edges after rounding
                if (idx > 0 && x < hist.bin_edges[static_cast<size_t>(idx)])
                {
                    --idx;
                }
                else if (idx < bins - 1 && x >= hist.bin_edges[static_cast<size_t>(idx) + 1])
                {
                    ++idx;
                }
                ++hist.counts[static_cast<size_t>(idx)];
            }

            return hist;
        }

    } // namespace stats
} // namespace riskcore
