/**
 * @file var_engine.hpp
 * @brief Value-at-Risk and Conditional VaR estimation.
 *
 * VaR and CVaR are reported as positive loss fractions of portfolio value
 * at confidence c, with alpha = 1 - c the tail probability:
 *
 *     VaR  = -q_alpha(R)
 *     CVaR = -E[R | R <= q_alpha(R)]
 *
 * Three estimators are supported (see var_method.hpp): empirical
 * quantile of the aggregated return sample, Normal or Student-t fit of
 * that sample, and a multivariate-normal simulation of the asset returns
 * projected through the portfolio weights.
 *
 * Degenerate inputs (zero volatility, Student-t df <= 2) never throw; they
 * produce a warning and a best-effort number.
 */

#ifndef RISKCORE_RISK_VAR_ENGINE_HPP
#define RISKCORE_RISK_VAR_ENGINE_HPP

#include "data/return_series.hpp"
#include "risk/var_method.hpp"
#include "stats/descriptive.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace riskcore
{
    namespace risk
    {

        /**
         * @struct VaREstimate
         * @brief Point estimate of VaR and CVaR.
         */
        struct VaREstimate
        {
            double var = 0.0;
            double cvar = 0.0;
        };

        /**
         * @struct ParametricEstimate
         * @brief Parametric VaR/CVaR with the fitted parameters.
         *
         * mu and sigma are always filled; df/loc/scale only for a Student-t fit.
         */
        struct ParametricEstimate
        {
            double var = 0.0;
            double cvar = 0.0;
            double mu = 0.0;
            double sigma = 0.0;
            std::optional<double> df;
            std::optional<double> loc;
            std::optional<double> scale;
        };

        /**
         * @struct MonteCarloEstimate
         * @brief Simulated VaR/CVaR with the simulated portfolio returns.
         */
        struct MonteCarloEstimate
        {
            double var = 0.0;
            double cvar = 0.0;
            std::vector<double> simulated;
            int simulations = 0;
        };

        /**
         * @struct ComponentVaR
         * @brief Parametric-normal VaR decomposition for one asset.
         */
        struct ComponentVaR
        {
            std::string symbol;
            double weight = 0.0;
            double marginal_var = 0.0;
            double component_var = 0.0;
        };

        /**
         * @struct RollingVaR
         * @brief Out-of-sample VaR path on the aggregated sample.
         *
         * var_series[k] is estimated on the window ending at dates[k];
         * realized[k] is the next aggregated return after that window.
         */
        struct RollingVaR
        {
            std::vector<std::string> dates;
            std::vector<double> var_series;
            std::vector<double> realized;
        };

        /**
         * @struct VaRMetadata
         * @brief Settings and fitted parameters behind a VaR figure.
         */
        struct VaRMetadata
        {
            int effective_n = 0;
            int horizon_days = 1;
            std::string return_type;
            std::string drift;
            std::string covariance_method = "sample";
            std::string var_units = "fraction";
            std::string horizon_model = "aggregation";

            // Method settings (only those of the selected method are set)
            std::optional<std::string> hs_weighting;
            std::optional<double> hs_lambda;
            std::optional<std::string> parametric_dist;
            std::optional<std::uint64_t> seed;
            std::optional<int> mc_sims;
            std::optional<int> simulations;

            // Fitted parameters
            std::optional<double> mu;
            std::optional<double> sigma;
            std::optional<double> df;
            std::optional<double> loc;
            std::optional<double> scale;
        };

        /**
         * @struct VaRResult
         * @brief Complete output of compute_var().
         */
        struct VaRResult
        {
            std::string method;
            double confidence = 0.95;
            double var = 0.0;
            double cvar = 0.0;
            std::optional<double> var_amount;
            std::optional<double> cvar_amount;

            stats::HistogramData histogram; ///< Simulated if available, else realized
            stats::HistogramData histogram_realized;
            std::optional<stats::HistogramData> histogram_simulated;

            std::optional<RollingVaR> rolling;
            std::vector<double> returns; ///< Aggregated sample the estimate used
            std::vector<std::string> warnings;
            VaRMetadata metadata;
            std::optional<std::vector<ComponentVaR>> contributions;
        };

        /**
         * @struct VaRRequest
         * @brief Parameters of a VaR computation.
         */
        struct VaRRequest
        {
            VaRMethod method = HistoricalMethod{};
            double confidence = 0.95;
            std::optional<int> lookback;     ///< Most recent observations to use (all if unset)
            ReturnType return_type = ReturnType::SIMPLE;
            int horizon_days = 1;
            Drift drift = Drift::IGNORE;
            std::optional<double> portfolio_value;
            int rolling_window = 250;        ///< 0 disables the rolling series
        };

        // ===================================================================
        // Estimators
        // ===================================================================

        /**
         * @brief Historical (optionally EWMA-weighted) VaR/CVaR.
         * @param returns Sample in chronological order (oldest first)
         * @throws InsufficientDataError if returns is empty
         * @throws InvalidParameterError if confidence is outside (0, 1)
         */
        VaREstimate historical_var_cvar(const std::vector<double> &returns,
                                        double confidence,
                                        const HistoricalMethod &method = HistoricalMethod{});

        /**
         * @brief Normal or Student-t VaR/CVaR.
         *
         * The sample is assumed to be at the target horizon already; no
         * further scaling is applied.
         *
         * @param warnings Receives degenerate-case warnings
         * @throws InsufficientDataError if fewer than 2 observations
         */
        ParametricEstimate parametric_var_cvar(const std::vector<double> &returns,
                                               double confidence,
                                               ParametricDistribution distribution,
                                               Drift drift,
                                               std::vector<std::string> &warnings);

        /**
         * @brief Monte Carlo VaR/CVaR from a multivariate-normal asset model.
         *
         * Mean and covariance are fitted on the complete rows of
         * asset_returns, scaled linearly by horizon_days, and sampled with a
         * std::mt19937_64 seeded from method.seed. Draws are capped at
         * MC_SIM_CAP. Identical inputs give bit-identical draws.
         *
         * @throws InsufficientDataError if fewer than 2 complete rows
         */
        MonteCarloEstimate monte_carlo_var_cvar(const AssetReturns &asset_returns,
                                                const PortfolioWeights &weights,
                                                double confidence,
                                                int horizon_days,
                                                const MonteCarloMethod &method,
                                                Drift drift);

        /**
         * @brief Per-asset parametric-normal VaR decomposition.
         *
         * With Sigma the sample covariance times horizon_days and
         * z = -Phi^{-1}(alpha), marginal_i = z (Sigma w)_i / sigma_p and
         * component_i = w_i marginal_i. Components sum to z sigma_p.
         *
         * @return nullopt if fewer than 2 complete rows or w' Sigma w <= 0
         */
        std::optional<std::vector<ComponentVaR>> component_var_normal(const AssetReturns &asset_returns,
                                                                      const PortfolioWeights &weights,
                                                                      double confidence,
                                                                      int horizon_days);

        /**
         * @brief Full VaR computation with histograms, rolling path and metadata.
         *
         * @param portfolio_returns Portfolio return series (absent values dropped)
         * @param asset_returns Per-asset returns, or nullptr
         * @param weights Portfolio weights, or nullptr
         * @throws InvalidParameterError for invalid confidence, horizon or lookback
         * @throws InsufficientDataError if no aggregated observation remains
         * @throws MissingInputError for Monte Carlo without asset returns or weights
         */
        VaRResult compute_var(const ReturnSeries &portfolio_returns,
                              const AssetReturns *asset_returns,
                              const PortfolioWeights *weights,
                              const VaRRequest &request);

        // ===================================================================
        // Export
        // ===================================================================

        nlohmann::json to_json(const VaRResult &result);

        /**
         * @brief Multi-line text summary for console output.
         */
        std::string summary(const VaRResult &result);

    } // namespace risk
} // namespace riskcore

#endif // RISKCORE_RISK_VAR_ENGINE_HPP
