/**
 * @file performance_metrics.cpp
 * @brief Implementation of the PerformanceMetrics class.
 */

#include "analytics/performance_metrics.hpp"
#include "core/errors.hpp"
#include "stats/descriptive.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace riskcore
{
    namespace analytics
    {

        // ===================================================================
        // Free functions
        // ===================================================================

        double daily_risk_free_rate(double annual_rate, ReturnType type, int ann_days)
        {
            if (ann_days < 1)
            {
                throw InvalidParameterError(
                    "Expected positive value for parameter 'annualization_days', got: " + std::to_string(ann_days));
            }
            if (type == ReturnType::LOG)
            {
                return annual_rate / static_cast<double>(ann_days);
            }
            return std::pow(1.0 + annual_rate, 1.0 / static_cast<double>(ann_days)) - 1.0;
        }

        std::vector<double> cumulative_growth(const std::vector<double> &returns, ReturnType type)
        {
            std::vector<double> cum;
            cum.reserve(returns.size());
            double level = 1.0;
            for (double r : returns)
            {
                double simple = type == ReturnType::LOG ? std::exp(r) - 1.0 : r;
                level *= 1.0 + simple;
                cum.push_back(level);
            }
            return cum;
        }

        std::vector<double> drawdown_series(const std::vector<double> &returns, ReturnType type)
        {
            std::vector<double> cum = cumulative_growth(returns, type);
            std::vector<double> dd(cum.size());
            double peak = -std::numeric_limits<double>::infinity();
            for (size_t i = 0; i < cum.size(); ++i)
            {
                peak = std::max(peak, cum[i]);
                dd[i] = cum[i] / peak - 1.0; // Non-positive
            }
            return dd;
        }

        int drawdown_duration(const std::vector<double> &drawdowns)
        {
            int longest = 0;
            int current = 0;
            for (double dd : drawdowns)
            {
                if (std::abs(dd) > 0.0)
                {
                    ++current;
                    longest = std::max(longest, current);
                }
                else
                {
                    current = 0;
                }
            }
            return longest;
        }

        // ===================================================================
        // Constructor
        // ===================================================================

        PerformanceMetrics::PerformanceMetrics(std::vector<double> returns,
                                               double risk_free_rate,
                                               int trading_days_per_year,
                                               ReturnType type)
            : returns_(std::move(returns)), risk_free_rate_(risk_free_rate), trading_days_per_year_(trading_days_per_year), type_(type), rf_daily_(daily_risk_free_rate(risk_free_rate, type, trading_days_per_year))
        {
            cumulative_ = cumulative_growth(returns_, type_);
            drawdowns_ = drawdown_series(returns_, type_);
        }

        // ===================================================================
        // Return Metrics
        // ===================================================================

        double PerformanceMetrics::annualized_return() const
        {
            if (returns_.empty())
            {
                return 0.0;
            }
            const double ann = static_cast<double>(trading_days_per_year_);
            if (type_ == ReturnType::LOG)
            {
                return stats::mean(returns_) * ann;
            }

            double total = 1.0;
            for (double r : returns_)
            {
                total *= 1.0 + r;
            }
            if (total <= 0.0)
            {
                return -1.0;
            }
            return std::pow(total, ann / static_cast<double>(returns_.size())) - 1.0;
        }

        // ===================================================================
        // Risk Metrics
        // ===================================================================

        double PerformanceMetrics::annualized_volatility() const
        {
            if (returns_.size() < 2)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return stats::sample_std(returns_) * std::sqrt(static_cast<double>(trading_days_per_year_));
        }

        double PerformanceMetrics::downside_deviation() const
        {
            if (returns_.size() < 2)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            std::vector<double> downside(returns_.size());
            std::transform(returns_.begin(), returns_.end(), downside.begin(),
                           [this](double r)
                           { return std::min(r - rf_daily_, 0.0); });
            return stats::sample_std(downside) * std::sqrt(static_cast<double>(trading_days_per_year_));
        }

        double PerformanceMetrics::max_drawdown() const
        {
            if (drawdowns_.empty())
            {
                return 0.0;
            }
            return std::abs(*std::min_element(drawdowns_.begin(), drawdowns_.end()));
        }

        int PerformanceMetrics::max_drawdown_duration() const
        {
            return drawdown_duration(drawdowns_);
        }

        double PerformanceMetrics::skewness() const
        {
            return stats::skewness(returns_);
        }

        double PerformanceMetrics::kurtosis() const
        {
            return stats::excess_kurtosis(returns_);
        }

        double PerformanceMetrics::best_day() const
        {
            if (returns_.empty())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return *std::max_element(returns_.begin(), returns_.end());
        }

        double PerformanceMetrics::worst_day() const
        {
            if (returns_.empty())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return *std::min_element(returns_.begin(), returns_.end());
        }

        double PerformanceMetrics::hit_ratio() const
        {
            if (returns_.empty())
            {
                return 0.0;
            }
            auto positive = std::count_if(returns_.begin(), returns_.end(), [](double r)
                                          { return r > 0.0; });
            return static_cast<double>(positive) / static_cast<double>(returns_.size());
        }

        // ===================================================================
        // Risk-Adjusted Metrics
        // ===================================================================

        double PerformanceMetrics::sharpe_ratio() const
        {
            if (returns_.size() < 2)
            {
                return 0.0;
            }
            const double ann = static_cast<double>(trading_days_per_year_);
            double vol_ann = stats::sample_std(returns_) * std::sqrt(ann);
            if (!(vol_ann > 0.0))
            {
                return 0.0;
            }
            return mean_excess() * ann / vol_ann;
        }

        double PerformanceMetrics::sortino_ratio() const
        {
            if (returns_.size() < 2)
            {
                return 0.0;
            }
            double excess_ann = mean_excess() * static_cast<double>(trading_days_per_year_);
            double downside_ann = downside_deviation();
            if (downside_ann == 0.0)
            {
                return excess_ann > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
            }
            return excess_ann / downside_ann;
        }

        std::optional<double> PerformanceMetrics::calmar_ratio() const
        {
            double mdd = max_drawdown();
            if (!(mdd > 0.0))
            {
                return std::nullopt;
            }
            return annualized_return() / mdd;
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        double PerformanceMetrics::mean_excess() const
        {
            double total = std::accumulate(returns_.begin(), returns_.end(), 0.0);
            return total / static_cast<double>(returns_.size()) - rf_daily_;
        }

    } // namespace analytics
} // namespace riskcore
