/**
 * @file benchmark_analysis.cpp
 * @brief Implementation of the BenchmarkAnalysis class.
 *
 * Alpha is annualized by multiplying the daily intercept by
 * trading_days_per_year; tracking error uses sqrt scaling.
 */

#include "analytics/benchmark_analysis.hpp"
#include "core/errors.hpp"
#include "stats/descriptive.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <limits>

namespace riskcore
{
    namespace analytics
    {

        AlignedReturns align_returns(const ReturnSeries &portfolio, const ReturnSeries &benchmark)
        {
            AlignedReturns aligned;
            for (size_t i = 0; i < portfolio.size(); ++i)
            {
                const auto &p = portfolio.value(i);
                if (!p)
                {
                    continue;
                }
                int j = benchmark.find_date(portfolio.date(i));
                if (j < 0)
                {
                    continue;
                }
                const auto &b = benchmark.value(static_cast<size_t>(j));
                if (!b)
                {
                    continue;
                }
                aligned.dates.push_back(portfolio.date(i));
                aligned.portfolio.push_back(*p);
                aligned.benchmark.push_back(*b);
            }
            return aligned;
        }

        // ===================================================================
        // Constructor
        // ===================================================================

        BenchmarkAnalysis::BenchmarkAnalysis(const std::vector<double> &portfolio_returns,
                                             const std::vector<double> &benchmark_returns,
                                             int trading_days_per_year)
            : portfolio_returns_(portfolio_returns), benchmark_returns_(benchmark_returns), trading_days_per_year_(trading_days_per_year)
        {
            if (portfolio_returns_.size() != benchmark_returns_.size())
            {
                throw InvalidParameterError(
                    "Portfolio return series size (" + std::to_string(portfolio_returns_.size()) + ") must match benchmark return series size (" + std::to_string(benchmark_returns_.size()) + ")");
            }
            if (portfolio_returns_.size() < 2)
            {
                throw InvalidParameterError(
                    "At least 2 observations are required for regression, got: " + std::to_string(portfolio_returns_.size()));
            }
            if (trading_days_per_year <= 0)
            {
                throw InvalidParameterError(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year));
            }

            active_returns_.resize(portfolio_returns_.size());
            for (size_t i = 0; i < portfolio_returns_.size(); ++i)
            {
                active_returns_[i] = portfolio_returns_[i] - benchmark_returns_[i];
            }

            run_regression();
        }

        // ===================================================================
        // Metrics
        // ===================================================================

        double BenchmarkAnalysis::alpha_annualized() const
        {
            return alpha_daily_ * static_cast<double>(trading_days_per_year_);
        }

        double BenchmarkAnalysis::correlation() const
        {
            const double mp = stats::mean(portfolio_returns_);
            const double mb = stats::mean(benchmark_returns_);
            double sxy = 0.0;
            double sxx = 0.0;
            double syy = 0.0;
            for (size_t i = 0; i < portfolio_returns_.size(); ++i)
            {
                double dp = portfolio_returns_[i] - mp;
                double db = benchmark_returns_[i] - mb;
                sxy += dp * db;
                sxx += dp * dp;
                syy += db * db;
            }
            if (sxx <= 0.0 || syy <= 0.0)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return sxy / std::sqrt(sxx * syy);
        }

        double BenchmarkAnalysis::tracking_error() const
        {
            return stats::sample_std(active_returns_) * std::sqrt(static_cast<double>(trading_days_per_year_));
        }

        std::optional<double> BenchmarkAnalysis::information_ratio() const
        {
            double te = tracking_error();
            if (!(te > 0.0))
            {
                return std::nullopt;
            }
            return stats::mean(active_returns_) * static_cast<double>(trading_days_per_year_) / te;
        }

        BenchmarkStats BenchmarkAnalysis::stats() const
        {
            BenchmarkStats out;
            out.beta = beta_;
            out.alpha_ann = alpha_annualized();
            out.r2 = r_squared_;
            out.corr = correlation();
            out.tracking_error_ann = tracking_error();
            out.information_ratio = information_ratio();
            out.num_observations = static_cast<int>(portfolio_returns_.size());
            return out;
        }

        // ===================================================================
        // Regression
        // ===================================================================

        void BenchmarkAnalysis::run_regression()
        {
            const Eigen::Index n = static_cast<Eigen::Index>(portfolio_returns_.size());
            Eigen::MatrixXd X(n, 2);
            Eigen::VectorXd y(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                X(i, 0) = 1.0;
                X(i, 1) = benchmark_returns_[static_cast<size_t>(i)];
                y(i) = portfolio_returns_[static_cast<size_t>(i)];
            }

            Eigen::VectorXd coef = X.colPivHouseholderQr().solve(y);
            alpha_daily_ = coef(0);
            beta_ = coef(1);

            Eigen::VectorXd residuals = y - X * coef;
            double ss_res = residuals.squaredNorm();
            double ss_tot = (y.array() - y.mean()).square().sum();
            r_squared_ = ss_tot > 0.0 ? 1.0 - ss_res / ss_tot
                                      : std::numeric_limits<double>::quiet_NaN();
        }

        std::optional<BenchmarkStats> benchmark_statistics(const ReturnSeries &portfolio,
                                                           const ReturnSeries &benchmark,
                                                           int trading_days_per_year)
        {
            AlignedReturns aligned = align_returns(portfolio, benchmark);
            if (aligned.dates.size() < MIN_BENCHMARK_OBSERVATIONS)
            {
                return std::nullopt;
            }
            BenchmarkAnalysis analysis(aligned.portfolio, aligned.benchmark, trading_days_per_year);
            return analysis.stats();
        }

    } // namespace analytics
} // namespace riskcore
