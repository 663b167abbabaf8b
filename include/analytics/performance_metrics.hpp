/**
 * @file performance_metrics.hpp
 * @brief Return, risk and risk-adjusted metrics for a portfolio return series.
 *
 * The return convention matters throughout: log returns are annualised
 * arithmetically and converted back to simple growth before compounding;
 * simple returns are annualised CAGR-style.
 *
 * All annualized calculations default to 252 trading days per year.
 */

#ifndef RISKCORE_ANALYTICS_PERFORMANCE_METRICS_HPP
#define RISKCORE_ANALYTICS_PERFORMANCE_METRICS_HPP

#include "data/return_series.hpp"

#include <optional>
#include <string>
#include <vector>

namespace riskcore
{
    namespace analytics
    {

        /**
         * @brief Convert an annual risk-free rate to a per-period rate.
         *
         * Log returns: rf / ann_days. Simple returns: (1 + rf)^(1/ann_days) - 1.
         *
         * @throws InvalidParameterError if ann_days < 1
         */
        double daily_risk_free_rate(double annual_rate, ReturnType type, int ann_days);

        /**
         * @brief Cumulative growth of 1 unit invested, one value per return.
         */
        std::vector<double> cumulative_growth(const std::vector<double> &returns, ReturnType type);

        /**
         * @brief Underwater curve cum / running_max - 1 (non-positive).
         */
        std::vector<double> drawdown_series(const std::vector<double> &returns, ReturnType type);

        /**
         * @brief Longest run of consecutive periods spent below the running peak.
         */
        int drawdown_duration(const std::vector<double> &drawdowns);

        /**
         * @class PerformanceMetrics
         * @brief Point metrics over one cleaned return series.
         *
         * Usage:
         * @code
         *   PerformanceMetrics metrics(returns.observed_values(), 0.045, 252, ReturnType::LOG);
         *   double sharpe = metrics.sharpe_ratio();
         *   double max_dd = metrics.max_drawdown();
         * @endcode
         *
         * Instances are immutable after construction.
         */
        class PerformanceMetrics
        {
        public:
            /**
             * @brief Construct from a return series without missing values.
             * @param returns Per-period returns in chronological order.
             * @param risk_free_rate Annualized risk-free rate.
             * @param trading_days_per_year Periods per year for annualisation.
             * @param type Return convention of the series.
             * @throws InvalidParameterError if trading_days_per_year < 1.
             */
            PerformanceMetrics(std::vector<double> returns,
                               double risk_free_rate = 0.0,
                               int trading_days_per_year = 252,
                               ReturnType type = ReturnType::LOG);

            ~PerformanceMetrics() = default;

            // ---------------------------------------------------------------
            // Return Metrics
            // ---------------------------------------------------------------

            /**
             * @brief Annualized return.
             *
             * Log: mean * ann_days. Simple: prod(1 + r)^(ann_days / n) - 1,
             * or -1 if cumulative growth is not positive. 0 for an empty series.
             */
            double annualized_return() const;

            // ---------------------------------------------------------------
            // Risk Metrics
            // ---------------------------------------------------------------

            /**
             * @brief Sample std * sqrt(ann_days); NaN with fewer than 2 returns.
             */
            double annualized_volatility() const;

            /**
             * @brief Annualized sample std of min(r - rf_daily, 0).
             * @return NaN with fewer than 2 returns.
             */
            double downside_deviation() const;

            /** @brief Largest peak-to-trough decline as a positive fraction. */
            double max_drawdown() const;

            /** @brief Longest drawdown spell in periods. */
            int max_drawdown_duration() const;

            const std::vector<double> &cumulative_returns() const { return cumulative_; }
            const std::vector<double> &drawdowns() const { return drawdowns_; }

            /** @brief Biased skewness (0 for empty or constant series). */
            double skewness() const;

            /** @brief Biased excess kurtosis (0 for empty or constant series). */
            double kurtosis() const;

            double best_day() const;
            double worst_day() const;

            /** @brief Share of strictly positive returns. */
            double hit_ratio() const;

            // ---------------------------------------------------------------
            // Risk-Adjusted Metrics
            // ---------------------------------------------------------------

            /**
             * @brief mean(r - rf_daily) * ann_days / (std(r) * sqrt(ann_days)).
             * @note Returns 0.0 if volatility is zero or undefined.
             */
            double sharpe_ratio() const;

            /**
             * @brief Excess annual return over annualized downside deviation.
             *
             * With zero downside deviation: +infinity if the excess return is
             * positive, else 0.
             */
            double sortino_ratio() const;

            /**
             * @brief annualized_return / max_drawdown; nullopt if no drawdown.
             */
            std::optional<double> calmar_ratio() const;

            // ---------------------------------------------------------------
            // Accessors
            // ---------------------------------------------------------------

            const std::vector<double> &returns() const { return returns_; }
            size_t size() const { return returns_.size(); }
            double risk_free_rate() const { return risk_free_rate_; }
            double daily_risk_free() const { return rf_daily_; }
            int trading_days_per_year() const { return trading_days_per_year_; }
            ReturnType return_type() const { return type_; }

        private:
            double mean_excess() const;

            std::vector<double> returns_;
            double risk_free_rate_;
            int trading_days_per_year_;
            ReturnType type_;
            double rf_daily_;

            std::vector<double> cumulative_;
            std::vector<double> drawdowns_;
        };

    } // namespace analytics
} // namespace riskcore

#endif // RISKCORE_ANALYTICS_PERFORMANCE_METRICS_HPP
