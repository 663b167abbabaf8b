/**
 * @file returns_engine.cpp
 * @brief Implementation of the returns engine.
 */

#include "returns/returns_engine.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>

namespace riskcore
{
    namespace returns
    {

        AssetReturns compute_returns(const PriceHistory &prices, ReturnType type)
        {
            const size_t n_dates = prices.num_dates();
            const size_t n_assets = prices.num_assets();

            if (n_dates < 2)
            {
                return AssetReturns({}, prices.get_tickers(),
                                    Eigen::MatrixXd(0, static_cast<Eigen::Index>(n_assets)),
                                    AssetReturns::Mask(0, static_cast<Eigen::Index>(n_assets)));
            }

            const Eigen::Index rows = static_cast<Eigen::Index>(n_dates - 1);
            const Eigen::Index cols = static_cast<Eigen::Index>(n_assets);
            Eigen::MatrixXd values = Eigen::MatrixXd::Zero(rows, cols);
            AssetReturns::Mask present = AssetReturns::Mask::Constant(rows, cols, false);

            for (size_t i = 1; i < n_dates; ++i)
            {
                for (size_t j = 0; j < n_assets; ++j)
                {
                    auto p_t = prices.price(i, j);
                    auto p_tm1 = prices.price(i - 1, j);
                    if (!p_t || !p_tm1 || *p_tm1 <= 0.0)
                    {
                        continue;
                    }

                    double r = type == ReturnType::LOG
                                   ? std::log(*p_t / *p_tm1)
                                   : *p_t / *p_tm1 - 1.0;
                    if (!std::isfinite(r))
                    {
                        continue;
                    }

                    const Eigen::Index row = static_cast<Eigen::Index>(i - 1);
                    values(row, static_cast<Eigen::Index>(j)) = r;
                    present(row, static_cast<Eigen::Index>(j)) = true;
                }
            }

            std::vector<std::string> dates(prices.get_dates().begin() + 1, prices.get_dates().end());
            return AssetReturns(std::move(dates), prices.get_tickers(), values, present);
        }

        ReturnSeries portfolio_returns(const AssetReturns &asset_returns,
                                       const PortfolioWeights &weights)
        {
            if (asset_returns.num_dates() == 0)
            {
                return ReturnSeries();
            }

            Eigen::VectorXd w = asset_returns.weight_vector(weights);

            std::vector<std::optional<double>> values;
            values.reserve(asset_returns.num_dates());
            size_t missing = 0;

            for (size_t i = 0; i < asset_returns.num_dates(); ++i)
            {
                double total = 0.0;
                bool complete = true;
                for (size_t j = 0; j < asset_returns.num_assets(); ++j)
                {
                    double wj = w(static_cast<Eigen::Index>(j));
                    if (wj == 0.0)
                    {
                        continue;
                    }
                    auto r = asset_returns.value(i, j);
                    if (!r)
                    {
                        complete = false;
                        break;
                    }
                    total += wj * *r;
                }

                if (complete)
                {
                    values.emplace_back(total);
                }
                else
                {
                    values.emplace_back(std::nullopt);
                    ++missing;
                }
            }

            if (missing > 0)
            {
                double pct = 100.0 * static_cast<double>(missing) / static_cast<double>(values.size());
                std::cerr << "Warning: portfolio returns contain " << missing << " undefined values ("
                          << std::fixed << std::setprecision(1) << pct << "%)" << std::endl;
            }

            return ReturnSeries(asset_returns.dates(), std::move(values));
        }

        ReturnSeries aggregate_to_horizon(const ReturnSeries &returns,
                                          ReturnType type,
                                          int horizon_days)
        {
            if (horizon_days <= 1)
            {
                return returns.dropna();
            }

            const size_t h = static_cast<size_t>(horizon_days);
            std::vector<std::string> dates;
            std::vector<std::optional<double>> values;

            // Length of the run of present values ending at i
            size_t run = 0;
            for (size_t i = 0; i < returns.size(); ++i)
            {
                if (!returns.value(i))
                {
                    run = 0;
                    continue;
                }
                ++run;
                if (run < h)
                {
                    continue;
                }

                double agg = type == ReturnType::LOG ? 0.0 : 1.0;
                for (size_t k = i + 1 - h; k <= i; ++k)
                {
                    double r = *returns.value(k);
                    if (type == ReturnType::LOG)
                    {
                        agg += r;
                    }
                    else
                    {
                        agg *= 1.0 + r;
                    }
                }
                if (type == ReturnType::SIMPLE)
                {
                    agg -= 1.0;
                }

                dates.push_back(returns.date(i));
                values.emplace_back(agg);
            }

            return ReturnSeries(std::move(dates), std::move(values));
        }

    } // namespace returns
} // namespace riskcore
