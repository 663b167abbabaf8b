/**
 * @file test_var_backtest.cpp
 * @brief Tests for the rolling VaR backtest and the Kupiec POF test
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "backtest/var_backtest.hpp"
#include "core/errors.hpp"
#include "risk/var_engine.hpp"

#include <cmath>
#include <cstdio>
#include <random>

using namespace riskcore;
using namespace riskcore::backtest;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace
{
    std::vector<std::string> make_dates(size_t n)
    {
        std::vector<std::string> dates;
        dates.reserve(n);
        for (size_t i = 0; i < n; ++i)
        {
            char buf[11];
            std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                          2000 + static_cast<int>(i / 336),
                          1 + static_cast<int>((i / 28) % 12),
                          1 + static_cast<int>(i % 28));
            dates.emplace_back(buf);
        }
        return dates;
    }

    ReturnSeries make_portfolio(size_t n, unsigned seed)
    {
        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(0.0003, 0.01);
        std::vector<double> values(n);
        for (auto &v : values)
        {
            v = dist(gen);
        }
        return ReturnSeries::from_values(make_dates(n), values);
    }
}

TEST_CASE("Kupiec POF test", "[Backtest][Kupiec]")
{
    SECTION("Observed rate equal to expected")
    {
        KupiecResult k = kupiec_pof_test(100, 5, 0.95);
        REQUIRE(k.lr.has_value());
        REQUIRE_THAT(*k.lr, WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(*k.p_value, WithinAbs(1.0, 1e-6));
    }

    SECTION("Too many exceptions are rejected")
    {
        KupiecResult k = kupiec_pof_test(250, 10, 0.99);
        REQUIRE_THAT(*k.lr, WithinRel(12.955491062356018, 1e-9));
        REQUIRE_THAT(*k.p_value, WithinRel(0.0003189845082133835, 1e-5));
    }

    SECTION("Zero exceptions stay finite")
    {
        KupiecResult k = kupiec_pof_test(250, 0, 0.99);
        REQUIRE(k.lr.has_value());
        REQUIRE(std::isfinite(*k.lr));
        REQUIRE(*k.lr > 0.0);
    }

    SECTION("No observations")
    {
        KupiecResult k = kupiec_pof_test(0, 0, 0.95);
        REQUIRE_FALSE(k.lr.has_value());
        REQUIRE_FALSE(k.p_value.has_value());
    }
}

TEST_CASE("VaRBacktester windows", "[Backtest]")
{
    ReturnSeries portfolio = make_portfolio(300, 11);

    BacktestRequest request;
    request.lookback = 100;
    request.backtest_days = 50;

    SECTION("Evaluates the trailing backtest days")
    {
        BacktestResult result = backtest_var(portfolio, nullptr, nullptr, request);

        REQUIRE(result.method == "historical");
        REQUIRE(result.available_days == 300);
        REQUIRE(result.effective_lookback == 100);
        REQUIRE(result.effective_backtest == 50);
        REQUIRE(result.series.dates.size() == 50);
        REQUIRE(result.series.dates.front() == portfolio.date(250));
        REQUIRE(result.series.dates.back() == portfolio.date(299));
        REQUIRE(static_cast<size_t>(result.exceptions_count) == result.exceptions_table.size());
        REQUIRE_THAT(result.exceptions_rate, WithinAbs(result.exceptions_count / 50.0, 1e-12));

        for (size_t i = 0; i < result.series.dates.size(); ++i)
        {
            REQUIRE(result.series.var_threshold[i] <= 0.0);
            REQUIRE(result.series.exceptions[i] == (result.series.realized[i] < result.series.var_threshold[i]));
        }
    }

    SECTION("Threshold uses only the preceding window")
    {
        BacktestResult result = backtest_var(portfolio, nullptr, nullptr, request);

        std::vector<double> window = portfolio.slice(199, 299).observed_values();
        double expected = -std::abs(risk::historical_var_cvar(window, 0.95).var);
        REQUIRE_THAT(result.series.var_threshold.back(), WithinAbs(expected, 1e-15));

        // A crash on the last day changes the realized return, never its threshold
        std::vector<double> shocked = portfolio.observed_values();
        shocked.back() = -0.5;
        BacktestResult shocked_result =
            backtest_var(ReturnSeries::from_values(portfolio.dates(), shocked), nullptr, nullptr, request);

        REQUIRE(shocked_result.series.var_threshold == result.series.var_threshold);
        REQUIRE(shocked_result.series.exceptions.back());
        REQUIRE(shocked_result.exceptions_table.back().date == portfolio.date(299));
    }

    SECTION("Lookback and horizon shrink to the available data")
    {
        request.lookback = 250;
        request.backtest_days = 250;
        ReturnSeries short_series = portfolio.slice(0, 100);
        BacktestResult result = backtest_var(short_series, nullptr, nullptr, request);
        REQUIRE(result.effective_lookback == 99);
        REQUIRE(result.effective_backtest == 1);
        REQUIRE(result.series.dates.size() == 1);
    }

    SECTION("Parametric method")
    {
        request.method = risk::ParametricMethod{risk::ParametricDistribution::NORMAL};
        BacktestResult result = backtest_var(portfolio, nullptr, nullptr, request);
        REQUIRE(result.method == "parametric");
        REQUIRE(result.series.dates.size() == 50);
        REQUIRE(result.kupiec.p_value.has_value());
    }
}

TEST_CASE("VaRBacktester Monte Carlo", "[Backtest][MonteCarlo]")
{
    const size_t n = 160;
    auto dates = make_dates(n);
    std::mt19937 gen(5);
    std::normal_distribution<double> dist(0.0, 0.01);

    Eigen::MatrixXd values(n, 2);
    std::vector<double> port(n);
    for (size_t i = 0; i < n; ++i)
    {
        values(i, 0) = dist(gen);
        values(i, 1) = dist(gen);
        port[i] = 0.5 * values(i, 0) + 0.5 * values(i, 1);
    }
    AssetReturns assets = AssetReturns::from_matrix(dates, {"AAA", "BBB"}, values);
    PortfolioWeights weights = {{"AAA", 0.5}, {"BBB", 0.5}};
    ReturnSeries portfolio = ReturnSeries::from_values(dates, port);

    BacktestRequest request;
    request.method = risk::MonteCarloMethod{2000, 99};
    request.lookback = 120;
    request.backtest_days = 20;

    SECTION("Reproducible with a fixed seed")
    {
        BacktestResult first = backtest_var(portfolio, &assets, &weights, request);
        BacktestResult second = backtest_var(portfolio, &assets, &weights, request);
        REQUIRE(first.method == "monte_carlo");
        REQUIRE(first.series.dates.size() == 20);
        REQUIRE(first.series.var_threshold == second.series.var_threshold);
    }

    SECTION("Requires asset returns and weights")
    {
        REQUIRE_THROWS_AS(backtest_var(portfolio, nullptr, &weights, request), MissingInputError);
        REQUIRE_THROWS_AS(backtest_var(portfolio, &assets, nullptr, request), MissingInputError);
    }
}

TEST_CASE("VaRBacktester errors and export", "[Backtest]")
{
    BacktestRequest request;

    SECTION("Invalid request")
    {
        request.lookback = 0;
        REQUIRE_THROWS_AS(VaRBacktester(request), InvalidParameterError);

        request.lookback = 250;
        request.confidence = 1.0;
        REQUIRE_THROWS_AS(VaRBacktester(request), InvalidParameterError);
    }

    SECTION("Insufficient data")
    {
        REQUIRE_THROWS_AS(backtest_var(ReturnSeries(), nullptr, nullptr, request), InsufficientDataError);
        // Every estimation window is below the minimum
        REQUIRE_THROWS_AS(backtest_var(make_portfolio(8, 3), nullptr, nullptr, request), InsufficientDataError);
    }

    SECTION("JSON export")
    {
        request.lookback = 60;
        request.backtest_days = 40;
        BacktestResult result = backtest_var(make_portfolio(120, 9), nullptr, nullptr, request);
        auto j = to_json(result);

        REQUIRE(j["method"] == "historical");
        REQUIRE(j["effective_backtest"] == 40);
        REQUIRE(j["series"]["dates"].size() == 40);
        REQUIRE(j["series"]["exceptions"].size() == 40);
        REQUIRE(j["exceptions_table"].size() == static_cast<size_t>(result.exceptions_count));
        REQUIRE(j["kupiec_pvalue"].is_number());
        REQUIRE_FALSE(summary(result).empty());
    }
}
