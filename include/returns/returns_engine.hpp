/**
 * @file returns_engine.hpp
 * @brief Price-to-return conversion, portfolio aggregation and horizon scaling.
 */

#ifndef RISKCORE_RETURNS_RETURNS_ENGINE_HPP
#define RISKCORE_RETURNS_RETURNS_ENGINE_HPP

#include "data/price_history.hpp"
#include "data/return_series.hpp"

namespace riskcore
{
    namespace returns
    {

        /**
         * @brief Per-period returns for every asset.
         *
         * LOG gives ln(P_t / P_{t-1}); SIMPLE gives P_t / P_{t-1} - 1. The first
         * date has no return and is dropped. A cell is absent when either
         * price is absent or the previous price is not positive.
         *
         * @return Asset returns; empty (no rows) if prices has fewer than 2 dates.
         */
        AssetReturns compute_returns(const PriceHistory &prices, ReturnType type);

        /**
         * @brief Weighted sum of asset returns per date.
         *
         * Assets without a weight entry, and weights for symbols that are not
         * columns, contribute nothing. A date is absent when any asset
         * carrying a non-zero weight is absent on that date. When absent dates
         * exist their count and share are logged to std::cerr; callers read
         * the count back with ReturnSeries::missing_count().
         */
        ReturnSeries portfolio_returns(const AssetReturns &asset_returns,
                                       const PortfolioWeights &weights);

        /**
         * @brief Aggregate one-period returns to a multi-period horizon.
         *
         * horizon_days <= 1 returns the series with absent values dropped.
         * Otherwise every run of exactly horizon_days consecutive present
         * observations yields one value stamped with the run's last date:
         * the sum for LOG returns, prod(1 + r) - 1 for SIMPLE returns.
         * Windows touching an absent value are dropped, never padded.
         */
        ReturnSeries aggregate_to_horizon(const ReturnSeries &returns,
                                          ReturnType type,
                                          int horizon_days);

    } // namespace returns
} // namespace riskcore

#endif // RISKCORE_RETURNS_RETURNS_ENGINE_HPP
