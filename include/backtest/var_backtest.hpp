/**
 * @file var_backtest.hpp
 * @brief Out-of-sample VaR backtesting with the Kupiec POF test.
 *
 * For each date t of the backtest period, VaR is re-estimated on the
 * lookback observations strictly before t and compared with the realized
 * return at t. A realized return below -VaR is an exception.
 */

#ifndef RISKCORE_BACKTEST_VAR_BACKTEST_HPP
#define RISKCORE_BACKTEST_VAR_BACKTEST_HPP

#include "data/return_series.hpp"
#include "risk/var_method.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace riskcore
{
    namespace backtest
    {

        /** @brief Estimation windows shorter than this are skipped. */
        constexpr size_t MIN_ESTIMATION_OBSERVATIONS = 10;

        /**
         * @struct KupiecResult
         * @brief Likelihood-ratio statistic and its chi-squared(1) p-value.
         *
         * Both are absent when the test is undefined (no observations or a
         * non-finite statistic).
         */
        struct KupiecResult
        {
            std::optional<double> lr;
            std::optional<double> p_value;
        };

        /**
         * @brief Kupiec Proportion-of-Failures test.
         *
         * LR = -2 [x ln p + (n - x) ln(1 - p) - x ln(x/n) - (n - x) ln(1 - x/n)]
         * with p = 1 - confidence; both rates are clamped to [eps, 1 - eps].
         *
         * @param n Observations evaluated
         * @param exceptions Exceptions observed
         * @param confidence VaR confidence level
         * @param eps Clamp for the expected and observed rates
         */
        KupiecResult kupiec_pof_test(int n, int exceptions, double confidence, double eps = 1e-6);

        /**
         * @struct ExceptionRow
         * @brief One breach of the VaR threshold.
         */
        struct ExceptionRow
        {
            std::string date;
            double realized = 0.0;
            double var_threshold = 0.0;
        };

        /**
         * @struct BacktestSeries
         * @brief Per-date backtest path (evaluated dates only).
         */
        struct BacktestSeries
        {
            std::vector<std::string> dates;
            std::vector<double> realized;
            std::vector<double> var_threshold; ///< -VaR
            std::vector<bool> exceptions;
        };

        /**
         * @struct BacktestResult
         * @brief Output of a VaR backtest.
         */
        struct BacktestResult
        {
            std::string method;
            double confidence = 0.95;
            int exceptions_count = 0;
            double exceptions_rate = 0.0;
            KupiecResult kupiec;
            int available_days = 0;     ///< Present portfolio observations
            int effective_lookback = 0;
            int effective_backtest = 0;
            BacktestSeries series;
            std::vector<ExceptionRow> exceptions_table;
        };

        /**
         * @struct BacktestRequest
         * @brief Parameters of a VaR backtest.
         */
        struct BacktestRequest
        {
            risk::VaRMethod method = risk::HistoricalMethod{};
            double confidence = 0.95;
            int lookback = 250;
            int backtest_days = 250;
            risk::Drift drift = risk::Drift::IGNORE;
            bool verbose = false;
        };

        /**
         * @class VaRBacktester
         * @brief Rolling re-estimation of VaR over history.
         *
         * Usage:
         * @code
         *   BacktestRequest request;
         *   request.method = risk::ParametricMethod{};
         *   VaRBacktester backtester(request);
         *   BacktestResult result = backtester.run(portfolio_returns);
         * @endcode
         *
         * Monte Carlo estimates on date i of the backtest period are seeded
         * with seed + i.
         */
        class VaRBacktester
        {
        public:
            /**
             * @throws InvalidParameterError for confidence outside (0, 1) or
             *         non-positive lookback or backtest_days.
             */
            explicit VaRBacktester(const BacktestRequest &request);
            ~VaRBacktester() = default;

            /**
             * @brief Run the backtest.
             * @param portfolio_returns Portfolio returns (absent values dropped)
             * @param asset_returns Per-asset returns, required for Monte Carlo
             * @param weights Portfolio weights, required for Monte Carlo
             * @throws MissingInputError for Monte Carlo without asset returns or weights
             * @throws InsufficientDataError if the history is shorter than one
             *         lookback window or no date yields an estimate
             */
            BacktestResult run(const ReturnSeries &portfolio_returns,
                               const AssetReturns *asset_returns = nullptr,
                               const PortfolioWeights *weights = nullptr) const;

            const BacktestRequest &request() const { return request_; }

        private:
            /** VaR estimated on one window; index is the backtest date position. */
            double estimate_var(const ReturnSeries &window,
                                const AssetReturns *asset_returns,
                                const PortfolioWeights *weights,
                                size_t index) const;

            BacktestRequest request_;
        };

        /**
         * @brief Convenience wrapper around VaRBacktester::run().
         */
        BacktestResult backtest_var(const ReturnSeries &portfolio_returns,
                                    const AssetReturns *asset_returns,
                                    const PortfolioWeights *weights,
                                    const BacktestRequest &request);

        nlohmann::json to_json(const BacktestResult &result);

        std::string summary(const BacktestResult &result);

    } // namespace backtest
} // namespace riskcore

#endif // RISKCORE_BACKTEST_VAR_BACKTEST_HPP
