/**
 * @file var_backtest.cpp
 * @brief Implementation of the VaR backtester and the Kupiec test.
 */

#include "backtest/var_backtest.hpp"
#include "core/errors.hpp"
#include "core/json_utils.hpp"
#include "risk/var_engine.hpp"
#include "stats/distributions.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace riskcore
{
    namespace backtest
    {

        // ===================================================================
        // Kupiec POF test
        // ===================================================================

        KupiecResult kupiec_pof_test(int n, int exceptions, double confidence, double eps)
        {
            KupiecResult result;
            if (n <= 0)
            {
                return result;
            }

            const double x = static_cast<double>(exceptions);
            const double nd = static_cast<double>(n);
            const double expected_rate = std::clamp(1.0 - confidence, eps, 1.0 - eps);
            const double observed_rate = std::clamp(x / nd, eps, 1.0 - eps);

            double lr = -2.0 * (x * std::log(expected_rate) + (nd - x) * std::log(1.0 - expected_rate) - x * std::log(observed_rate) - (nd - x) * std::log(1.0 - observed_rate));
            if (!std::isfinite(lr))
            {
                return result;
            }

            result.lr = lr;
            result.p_value = 1.0 - stats::chi_squared_cdf(lr, 1.0);
            return result;
        }

        // ===================================================================
        // VaRBacktester
        // ===================================================================

        VaRBacktester::VaRBacktester(const BacktestRequest &request) : request_(request)
        {
            validate_confidence(request_.confidence);
            if (request_.lookback < 1)
            {
                throw InvalidParameterError(
                    "Expected positive value for parameter 'lookback', got: " + std::to_string(request_.lookback));
            }
            if (request_.backtest_days < 1)
            {
                throw InvalidParameterError(
                    "Expected positive value for parameter 'backtest_days', got: " + std::to_string(request_.backtest_days));
            }
        }

        BacktestResult VaRBacktester::run(const ReturnSeries &portfolio_returns,
                                          const AssetReturns *asset_returns,
                                          const PortfolioWeights *weights) const
        {
            const bool monte_carlo = std::holds_alternative<risk::MonteCarloMethod>(request_.method);
            if (monte_carlo && (!asset_returns || !weights))
            {
                throw MissingInputError("Monte Carlo requires asset_returns and weights");
            }

            ReturnSeries clean = portfolio_returns.dropna();
            const int available = static_cast<int>(clean.size());
            const int effective_lookback = std::min(request_.lookback, available - 1);
            const int max_backtest = std::max(0, available - effective_lookback);
            if (available == 0 || max_backtest <= 0)
            {
                throw InsufficientDataError(
                    "Insufficient data: available=" + std::to_string(available) +
                    ", requested_lookback=" + std::to_string(request_.lookback) +
                    ", requested_backtest=" + std::to_string(request_.backtest_days));
            }

            const int effective_backtest = std::min(request_.backtest_days, max_backtest);
            const size_t first = static_cast<size_t>(available - effective_backtest);
            const size_t lookback = static_cast<size_t>(request_.lookback);

            if (request_.verbose)
            {
                std::cout << "Backtesting VaR: method=" << risk::method_name(request_.method)
                          << ", confidence=" << request_.confidence
                          << ", lookback=" << request_.lookback
                          << ", days=" << effective_backtest << std::endl;
            }

            BacktestResult result;
            result.method = risk::method_name(request_.method);
            result.confidence = request_.confidence;
            result.available_days = available;
            result.effective_lookback = effective_lookback;
            result.effective_backtest = effective_backtest;

            for (size_t i = 0; i < static_cast<size_t>(effective_backtest); ++i)
            {
                const size_t t = first + i;
                // Window [t - lookback, t) never contains t itself
                const size_t begin = t > lookback ? t - lookback : 0;
                ReturnSeries window = clean.slice(begin, t);
                if (window.size() < MIN_ESTIMATION_OBSERVATIONS)
                {
                    continue;
                }

                double var_loss = 0.0;
                try
                {
                    var_loss = estimate_var(window, asset_returns, weights, i);
                }
                catch (const std::exception &e)
                {
                    if (request_.verbose)
                    {
                        std::cerr << "Failed to compute VaR on " << clean.date(t) << ": " << e.what() << std::endl;
                    }
                    continue;
                }

                var_loss = std::abs(var_loss);
                const double realized = *clean.value(t);
                const double threshold = -var_loss;
                const bool exception = realized < threshold;

                result.series.dates.push_back(clean.date(t));
                result.series.realized.push_back(realized);
                result.series.var_threshold.push_back(threshold);
                result.series.exceptions.push_back(exception);

                if (exception)
                {
                    result.exceptions_table.push_back({clean.date(t), realized, threshold});
                }
            }

            if (result.series.dates.empty())
            {
                throw InsufficientDataError("No valid backtest observations");
            }

            const int n = static_cast<int>(result.series.dates.size());
            result.exceptions_count = static_cast<int>(result.exceptions_table.size());
            result.exceptions_rate = static_cast<double>(result.exceptions_count) / static_cast<double>(n);
            result.kupiec = kupiec_pof_test(n, result.exceptions_count, request_.confidence);

            if (request_.verbose)
            {
                std::cout << "Backtest complete: " << result.exceptions_count << " exceptions in "
                          << n << " observations" << std::endl;
            }

            return result;
        }

        double VaRBacktester::estimate_var(const ReturnSeries &window,
                                           const AssetReturns *asset_returns,
                                           const PortfolioWeights *weights,
                                           size_t index) const
        {
            const std::vector<double> values = window.observed_values();

            if (const auto *hist = std::get_if<risk::HistoricalMethod>(&request_.method))
            {
                return risk::historical_var_cvar(values, request_.confidence, *hist).var;
            }
            if (const auto *param = std::get_if<risk::ParametricMethod>(&request_.method))
            {
                std::vector<std::string> warnings;
                return risk::parametric_var_cvar(values, request_.confidence, param->distribution,
                                                 request_.drift, warnings)
                    .var;
            }

            risk::MonteCarloMethod mc = std::get<risk::MonteCarloMethod>(request_.method);
            mc.seed += static_cast<std::uint64_t>(index);
            AssetReturns window_assets = asset_returns->align_to(window.dates()).complete_rows();
            return risk::monte_carlo_var_cvar(window_assets, *weights, request_.confidence, 1, mc, request_.drift).var;
        }

        BacktestResult backtest_var(const ReturnSeries &portfolio_returns,
                                    const AssetReturns *asset_returns,
                                    const PortfolioWeights *weights,
                                    const BacktestRequest &request)
        {
            VaRBacktester backtester(request);
            return backtester.run(portfolio_returns, asset_returns, weights);
        }

        // ===================================================================
        // Export
        // ===================================================================

        nlohmann::json to_json(const BacktestResult &result)
        {
            nlohmann::json j;
            j["method"] = result.method;
            j["confidence"] = result.confidence;
            j["exceptions_count"] = result.exceptions_count;
            j["exceptions_rate"] = json_utils::number(result.exceptions_rate);
            j["kupiec_lr"] = json_utils::number(result.kupiec.lr);
            j["kupiec_pvalue"] = json_utils::number(result.kupiec.p_value);
            j["available_days"] = result.available_days;
            j["effective_lookback"] = result.effective_lookback;
            j["effective_backtest"] = result.effective_backtest;

            j["series"]["dates"] = result.series.dates;
            j["series"]["realized"] = json_utils::array(result.series.realized);
            j["series"]["var_threshold"] = json_utils::array(result.series.var_threshold);
            j["series"]["exceptions"] = result.series.exceptions;

            nlohmann::json table = nlohmann::json::array();
            for (const auto &row : result.exceptions_table)
            {
                table.push_back({{"date", row.date},
                                 {"realized", json_utils::number(row.realized)},
                                 {"var_threshold", json_utils::number(row.var_threshold)}});
            }
            j["exceptions_table"] = table;
            return j;
        }

        std::string summary(const BacktestResult &result)
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "VaR Backtest\n";
            oss << "============\n";
            oss << "  Method:              " << result.method << "\n";
            oss << "  Confidence:          " << std::setprecision(2) << result.confidence * 100.0 << "%\n";
            oss << "  Observations:        " << result.series.dates.size() << "\n";
            oss << "  Exceptions:          " << result.exceptions_count << "\n";
            oss << "  Exception Rate:      " << std::setprecision(2) << result.exceptions_rate * 100.0
                << "% (expected " << (1.0 - result.confidence) * 100.0 << "%)\n";
            oss << "  Kupiec LR:           ";
            if (result.kupiec.lr)
            {
                oss << std::setprecision(4) << *result.kupiec.lr << "\n";
            }
            else
            {
                oss << "n/a\n";
            }
            oss << "  Kupiec p-value:      ";
            if (result.kupiec.p_value)
            {
                oss << std::setprecision(4) << *result.kupiec.p_value << "\n";
            }
            else
            {
                oss << "n/a\n";
            }
            return oss.str();
        }

    } // namespace backtest
} // namespace riskcore
