/**
 * @file risk_metrics_engine.hpp
 * @brief Portfolio risk analytics over a return history.
 *
 * Combines PerformanceMetrics, RollingStatistics, BenchmarkAnalysis and the
 * risk contribution decomposition into one RiskMetricsResult. Data-quality
 * problems (short samples, sparse assets, missing benchmark) are reported
 * as warnings; only an empty portfolio series is an error.
 */

#ifndef RISKCORE_ANALYTICS_RISK_METRICS_ENGINE_HPP
#define RISKCORE_ANALYTICS_RISK_METRICS_ENGINE_HPP

#include "analytics/benchmark_analysis.hpp"
#include "analytics/benchmark_provider.hpp"
#include "analytics/risk_contributions.hpp"
#include "analytics/rolling_statistics.hpp"
#include "data/return_series.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace riskcore
{
    namespace analytics
    {

        /** @brief Assets missing more than this share of aligned rows are dropped. */
        constexpr double MAX_ASSET_MISSING_FRACTION = 0.20;

        /**
         * @struct RiskSummary
         * @brief Headline figures.
         */
        struct RiskSummary
        {
            double ann_vol = 0.0;
            double ann_return = 0.0;
            double max_drawdown = 0.0;
            int dd_duration_days = 0;
            double sharpe_ratio = 0.0;
            double sortino_ratio = 0.0; ///< May be +infinity; exported as null
            std::optional<double> beta;
        };

        /**
         * @struct TailStats
         * @brief Distribution shape and downside figures.
         */
        struct TailStats
        {
            double skew = 0.0;
            double kurtosis = 0.0; ///< Excess
            double best_day = 0.0;
            double worst_day = 0.0;
            double hit_ratio = 0.0;
            double downside_dev_ann = 0.0;
            std::optional<double> calmar_ratio;
        };

        /**
         * @struct PathSeries
         * @brief Portfolio path with the benchmark aligned to its dates.
         */
        struct PathSeries
        {
            std::vector<std::string> dates;
            std::vector<double> portfolio;
            std::optional<std::vector<std::optional<double>>> benchmark;
        };

        struct CorrelationBlock
        {
            std::vector<std::string> symbols;
            Eigen::MatrixXd matrix; ///< NaN where a variance is zero
        };

        struct RiskMetadata
        {
            int annualization_days = 252;
            std::string return_type;
            int effective_days = 0;
            std::vector<std::string> symbols;
            std::optional<std::string> benchmark_symbol;
            double risk_free_rate = 0.0;
        };

        /**
         * @struct RiskMetricsResult
         * @brief Complete output of compute_risk_metrics().
         */
        struct RiskMetricsResult
        {
            RiskSummary summary;
            RollingSeries rolling_vol;
            RollingSeries rolling_sharpe;
            CorrelationBlock correlation;
            std::vector<RiskContribution> contributions;
            PathSeries cumulative_returns;
            PathSeries drawdown_series;
            std::optional<TailStats> stats;
            std::optional<BenchmarkStats> benchmark;
            RiskMetadata metadata;
            std::vector<std::string> warnings;
        };

        /**
         * @struct RiskMetricsRequest
         * @brief Parameters of a risk metrics computation.
         */
        struct RiskMetricsRequest
        {
            std::optional<std::string> benchmark_symbol;
            std::vector<int> rolling_windows = {30, 90, 252};
            double risk_free_rate = 0.0; ///< Annual
            int annualization_days = 252;
            ReturnType return_type = ReturnType::LOG;
            bool include_benchmark = true;
        };

        /**
         * @brief Compute the full risk metrics report.
         *
         * @param portfolio_returns Portfolio returns (absent values dropped)
         * @param asset_returns Per-asset returns, aligned to the portfolio dates
         * @param weights Weight per symbol (missing symbols are zero)
         * @param request Settings
         * @param benchmark_provider Source of benchmark returns, or nullptr
         * @throws InvalidParameterError for non-positive annualization days
         *         or a rolling window below 2
         * @throws InsufficientDataError if the portfolio series has no values
         */
        RiskMetricsResult compute_risk_metrics(const ReturnSeries &portfolio_returns,
                                               const AssetReturns &asset_returns,
                                               const PortfolioWeights &weights,
                                               const RiskMetricsRequest &request,
                                               const BenchmarkProvider *benchmark_provider = nullptr);

        nlohmann::json to_json(const RiskMetricsResult &result);

        std::string summary(const RiskMetricsResult &result);

    } // namespace analytics
} // namespace riskcore

#endif // RISKCORE_ANALYTICS_RISK_METRICS_ENGINE_HPP
