/**
 * @file benchmark_analysis.hpp
 * @brief Relative performance analysis against a benchmark.
 *
 * Regresses portfolio returns on benchmark returns over their date-aligned
 * overlap:
 *
 *   R_p = alpha + beta * R_b + epsilon
 *
 * and derives tracking error and information ratio from the active
 * return R_p - R_b.
 */

#ifndef RISKCORE_ANALYTICS_BENCHMARK_ANALYSIS_HPP
#define RISKCORE_ANALYTICS_BENCHMARK_ANALYSIS_HPP

#include "data/return_series.hpp"

#include <optional>
#include <string>
#include <vector>

namespace riskcore
{
    namespace analytics
    {

        /** @brief Minimum aligned observations for the regression block. */
        constexpr size_t MIN_BENCHMARK_OBSERVATIONS = 10;

        /**
         * @struct AlignedReturns
         * @brief Dates on which both series have a value, with both values.
         */
        struct AlignedReturns
        {
            std::vector<std::string> dates;
            std::vector<double> portfolio;
            std::vector<double> benchmark;
        };

        /**
         * @struct BenchmarkStats
         * @brief Regression and active-risk statistics vs a benchmark.
         */
        struct BenchmarkStats
        {
            double beta = 0.0;                     ///< OLS slope
            double alpha_ann = 0.0;                ///< OLS intercept * ann_days
            double r2 = 0.0;                       ///< Coefficient of determination
            double corr = 0.0;                     ///< Pearson correlation (NaN if undefined)
            double tracking_error_ann = 0.0;       ///< Annualized std of active returns
            std::optional<double> information_ratio; ///< Absent if tracking error is 0
            int num_observations = 0;
        };

        /**
         * @brief Inner join of two series on dates where both are present.
         */
        AlignedReturns align_returns(const ReturnSeries &portfolio, const ReturnSeries &benchmark);

        /**
         * @class BenchmarkAnalysis
         * @brief OLS regression and tracking metrics on aligned returns.
         *
         * Usage:
         * @code
         *   auto aligned = align_returns(portfolio, benchmark);
         *   BenchmarkAnalysis bench(aligned.portfolio, aligned.benchmark, 252);
         *   double beta = bench.beta();
         * @endcode
         */
        class BenchmarkAnalysis
        {
        public:
            /**
             * @throws InvalidParameterError if the series differ in size,
             *         hold fewer than 2 observations, or ann_days < 1.
             */
            BenchmarkAnalysis(const std::vector<double> &portfolio_returns,
                              const std::vector<double> &benchmark_returns,
                              int trading_days_per_year = 252);

            ~BenchmarkAnalysis() = default;

            double alpha_daily() const { return alpha_daily_; }
            double alpha_annualized() const;
            double beta() const { return beta_; }
            double r_squared() const { return r_squared_; }
            double correlation() const;

            /** @brief Sample std of active returns * sqrt(ann_days). */
            double tracking_error() const;

            /** @brief Annualized mean active return / tracking error. */
            std::optional<double> information_ratio() const;

            BenchmarkStats stats() const;

        private:
            void run_regression();

            std::vector<double> portfolio_returns_;
            std::vector<double> benchmark_returns_;
            std::vector<double> active_returns_;
            int trading_days_per_year_;

            double alpha_daily_ = 0.0;
            double beta_ = 0.0;
            double r_squared_ = 0.0;
        };

        /**
         * @brief Benchmark block for two unaligned series.
         * @return nullopt if fewer than MIN_BENCHMARK_OBSERVATIONS aligned dates.
         */
        std::optional<BenchmarkStats> benchmark_statistics(const ReturnSeries &portfolio,
                                                           const ReturnSeries &benchmark,
                                                           int trading_days_per_year);

    } // namespace analytics
} // namespace riskcore

#endif // RISKCORE_ANALYTICS_BENCHMARK_ANALYSIS_HPP
