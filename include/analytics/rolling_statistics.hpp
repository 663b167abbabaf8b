/**
 * @file rolling_statistics.hpp
 * @brief Trailing-window volatility and Sharpe ratio.
 *
 * Per-window outputs have one entry per input observation; the first
 * window - 1 entries, and any window whose statistic is not finite, are
 * absent. Several windows are combined into a RollingSeries whose dates
 * come from the first (reference) window.
 */

#ifndef RISKCORE_ANALYTICS_ROLLING_STATISTICS_HPP
#define RISKCORE_ANALYTICS_ROLLING_STATISTICS_HPP

#include "data/return_series.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riskcore
{
    namespace analytics
    {

        /**
         * @struct RollingSeries
         * @brief One value column per window, aligned to shared dates.
         */
        struct RollingSeries
        {
            std::vector<std::string> dates;
            std::vector<int> windows;                                     ///< In request order
            std::map<int, std::vector<std::optional<double>>> values;    ///< window -> column
        };

        /**
         * @class RollingStatistics
         * @brief Rolling metrics over one window size.
         *
         * Usage:
         * @code
         *   RollingStatistics rolling(returns, 90, rf_daily, 252);
         *   auto vol = rolling.volatility();
         *   auto sharpe = rolling.sharpe_ratio();
         * @endcode
         */
        class RollingStatistics
        {
        public:
            /**
             * @param returns Per-period returns without missing values
             * @param window_days Trailing window length
             * @param rf_daily Per-period risk-free rate
             * @param trading_days_per_year Periods per year
             * @throws InvalidParameterError if window_days < 2 or
             *         trading_days_per_year < 1
             */
            RollingStatistics(const std::vector<double> &returns,
                              int window_days,
                              double rf_daily = 0.0,
                              int trading_days_per_year = 252);

            ~RollingStatistics() = default;

            /**
             * @brief Rolling sample std * sqrt(ann_days).
             */
            std::vector<std::optional<double>> volatility() const;

            /**
             * @brief Rolling mean(r - rf_daily) * ann / (std(r) * sqrt(ann)).
             */
            std::vector<std::optional<double>> sharpe_ratio() const;

            int window() const { return window_; }

        private:
            /** Sample mean and std of the window ending at i. */
            void window_moments(size_t end, double &mean, double &std_dev) const;

            std::vector<double> returns_;
            int window_;
            double rf_daily_;
            int trading_days_per_year_;
        };

        /**
         * @brief Rolling volatility for several windows, aligned to the first.
         * @param returns Series with missing values already dropped
         */
        RollingSeries rolling_volatility(const ReturnSeries &returns,
                                         const std::vector<int> &windows,
                                         int trading_days_per_year);

        /**
         * @brief Rolling Sharpe ratio for several windows, aligned to the first.
         */
        RollingSeries rolling_sharpe(const ReturnSeries &returns,
                                     const std::vector<int> &windows,
                                     double rf_daily,
                                     int trading_days_per_year);

    } // namespace analytics
} // namespace riskcore

#endif // RISKCORE_ANALYTICS_ROLLING_STATISTICS_HPP
