/**
 * @file rolling_statistics.cpp
 * @brief Implementation of the RollingStatistics class.
 *
 * Uses direct per-window computation. Entry i of a per-window output
 * covers the observations [i - window + 1, i].
 */

#include "analytics/rolling_statistics.hpp"
#include "core/errors.hpp"

#include <cmath>

namespace riskcore
{
    namespace analytics
    {

        namespace
        {
            using Column = std::vector<std::optional<double>>;

            /**
             * @brief Combine per-window columns onto the dates where the first
             *        window has a value.
             */
            RollingSeries align_columns(const ReturnSeries &returns,
                                        const std::vector<int> &windows,
                                        const std::vector<Column> &columns)
            {
                RollingSeries out;
                out.windows = windows;
                if (windows.empty())
                {
                    return out;
                }

                std::vector<size_t> rows;
                const Column &reference = columns.front();
                for (size_t i = 0; i < reference.size(); ++i)
                {
                    if (reference[i])
                    {
                        rows.push_back(i);
                        out.dates.push_back(returns.date(i));
                    }
                }

                for (size_t k = 0; k < windows.size(); ++k)
                {
                    Column aligned;
                    aligned.reserve(rows.size());
                    for (size_t row : rows)
                    {
                        aligned.push_back(columns[k][row]);
                    }
                    out.values[windows[k]] = std::move(aligned);
                }
                return out;
            }
        } // anonymous namespace

        // ===================================================================
        // Constructor
        // ===================================================================

        RollingStatistics::RollingStatistics(const std::vector<double> &returns,
                                             int window_days,
                                             double rf_daily,
                                             int trading_days_per_year)
            : returns_(returns), window_(window_days), rf_daily_(rf_daily), trading_days_per_year_(trading_days_per_year)
        {
            if (window_days < 2)
            {
                throw InvalidParameterError(
                    "Expected window_days >= 2 for rolling statistics, got: " + std::to_string(window_days));
            }
            if (trading_days_per_year < 1)
            {
                throw InvalidParameterError(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year));
            }
        }

        // ===================================================================
        // Rolling Metrics
        // ===================================================================

        std::vector<std::optional<double>> RollingStatistics::volatility() const
        {
            std::vector<std::optional<double>> out(returns_.size());
            const size_t w = static_cast<size_t>(window_);
            const double root_ann = std::sqrt(static_cast<double>(trading_days_per_year_));

            for (size_t i = w - 1; i < returns_.size(); ++i)
            {
                double mean = 0.0;
                double std_dev = 0.0;
                window_moments(i, mean, std_dev);
                double vol = std_dev * root_ann;
                if (std::isfinite(vol))
                {
                    out[i] = vol;
                }
            }
            return out;
        }

        std::vector<std::optional<double>> RollingStatistics::sharpe_ratio() const
        {
            std::vector<std::optional<double>> out(returns_.size());
            const size_t w = static_cast<size_t>(window_);
            const double ann = static_cast<double>(trading_days_per_year_);

            for (size_t i = w - 1; i < returns_.size(); ++i)
            {
                double mean = 0.0;
                double std_dev = 0.0;
                window_moments(i, mean, std_dev);
                double sharpe = (mean - rf_daily_) * ann / (std_dev * std::sqrt(ann));
                if (std::isfinite(sharpe))
                {
                    out[i] = sharpe;
                }
            }
            return out;
        }

        void RollingStatistics::window_moments(size_t end, double &mean, double &std_dev) const
        {
            const size_t w = static_cast<size_t>(window_);
            const size_t begin = end + 1 - w;
            const double nd = static_cast<double>(w);

            double sum = 0.0;
            for (size_t i = begin; i <= end; ++i)
            {
                sum += returns_[i];
            }
            mean = sum / nd;

            double sum_sq = 0.0;
            for (size_t i = begin; i <= end; ++i)
            {
                double diff = returns_[i] - mean;
                sum_sq += diff * diff;
            }
            std_dev = std::sqrt(sum_sq / (nd - 1.0));
        }

        // ===================================================================
        // Multi-window series
        // ===================================================================

        RollingSeries rolling_volatility(const ReturnSeries &returns,
                                         const std::vector<int> &windows,
                                         int trading_days_per_year)
        {
            std::vector<double> values = returns.observed_values();
            ReturnSeries clean = returns.dropna();

            std::vector<Column> columns;
            for (int window : windows)
            {
                columns.push_back(RollingStatistics(values, window, 0.0, trading_days_per_year).volatility());
            }
            return align_columns(clean, windows, columns);
        }

        RollingSeries rolling_sharpe(const ReturnSeries &returns,
                                     const std::vector<int> &windows,
                                     double rf_daily,
                                     int trading_days_per_year)
        {
            std::vector<double> values = returns.observed_values();
            ReturnSeries clean = returns.dropna();

            std::vector<Column> columns;
            for (int window : windows)
            {
                columns.push_back(RollingStatistics(values, window, rf_daily, trading_days_per_year).sharpe_ratio());
            }
            return align_columns(clean, windows, columns);
        }

    } // namespace analytics
} // namespace riskcore
