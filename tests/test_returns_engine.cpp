/**
 * @file test_returns_engine.cpp
 * @brief Tests for return construction, portfolio aggregation and horizon scaling
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "returns/returns_engine.hpp"

#include <cmath>
#include <limits>

using namespace riskcore;
using Catch::Matchers::WithinAbs;

namespace
{
    const double NaN = std::numeric_limits<double>::quiet_NaN();

    PriceHistory make_prices()
    {
        Eigen::MatrixXd prices(4, 2);
        prices << 100.0, 200.0,
            110.0, 210.0,
            NaN, 220.0,
            115.0, 215.0;
        return PriceHistory(prices,
                            {"2020-01-01", "2020-01-02", "2020-01-03", "2020-01-06"},
                            {"AAPL", "MSFT"});
    }
}

TEST_CASE("compute_returns", "[Returns]")
{
    PriceHistory prices = make_prices();

    SECTION("Simple returns drop the first date")
    {
        AssetReturns r = returns::compute_returns(prices, ReturnType::SIMPLE);
        REQUIRE(r.num_dates() == 3);
        REQUIRE(r.dates().front() == "2020-01-02");
        REQUIRE_THAT(*r.value(0, 0), WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(*r.value(0, 1), WithinAbs(0.05, 1e-12));
    }

    SECTION("Log returns")
    {
        AssetReturns r = returns::compute_returns(prices, ReturnType::LOG);
        REQUIRE_THAT(*r.value(0, 0), WithinAbs(std::log(1.1), 1e-12));
        REQUIRE_THAT(*r.value(2, 1), WithinAbs(std::log(215.0 / 220.0), 1e-12));
    }

    SECTION("A missing price makes both adjacent returns absent")
    {
        AssetReturns r = returns::compute_returns(prices, ReturnType::SIMPLE);
        REQUIRE_FALSE(r.value(1, 0).has_value());
        REQUIRE_FALSE(r.value(2, 0).has_value());
        REQUIRE(r.value(1, 1).has_value());
    }

    SECTION("Fewer than two prices give an empty result")
    {
        Eigen::MatrixXd one(1, 1);
        one << 100.0;
        AssetReturns r = returns::compute_returns(PriceHistory(one, {"2020-01-01"}, {"AAPL"}),
                                                  ReturnType::LOG);
        REQUIRE(r.num_dates() == 0);
    }
}

TEST_CASE("portfolio_returns", "[Returns]")
{
    AssetReturns r = returns::compute_returns(make_prices(), ReturnType::SIMPLE);

    SECTION("Weighted sum per date")
    {
        PortfolioWeights w = {{"AAPL", 0.5}, {"MSFT", 0.5}};
        ReturnSeries p = returns::portfolio_returns(r, w);
        REQUIRE(p.size() == 3);
        REQUIRE_THAT(*p.value(0), WithinAbs(0.5 * 0.10 + 0.5 * 0.05, 1e-12));
        REQUIRE_FALSE(p.value(1).has_value());
        REQUIRE(p.missing_count() == 2);
    }

    SECTION("Unweighted assets contribute nothing")
    {
        PortfolioWeights w = {{"MSFT", 1.0}, {"XOM", 0.3}};
        ReturnSeries p = returns::portfolio_returns(r, w);
        REQUIRE(p.missing_count() == 0);
        REQUIRE_THAT(*p.value(1), WithinAbs(220.0 / 210.0 - 1.0, 1e-12));
    }
}

TEST_CASE("aggregate_to_horizon", "[Returns][Horizon]")
{
    std::vector<std::string> dates = {"2020-01-01", "2020-01-02"};

    SECTION("Simple returns compound")
    {
        ReturnSeries r = ReturnSeries::from_values(dates, {0.01, 0.02});
        ReturnSeries h = returns::aggregate_to_horizon(r, ReturnType::SIMPLE, 2);
        REQUIRE(h.size() == 1);
        REQUIRE(h.date(0) == "2020-01-02");
        REQUIRE_THAT(*h.value(0), WithinAbs(1.01 * 1.02 - 1.0, 1e-14));
    }

    SECTION("Log returns add")
    {
        ReturnSeries r = ReturnSeries::from_values(dates, {std::log(1.01), std::log(1.02)});
        ReturnSeries h = returns::aggregate_to_horizon(r, ReturnType::LOG, 2);
        REQUIRE(h.size() == 1);
        REQUIRE_THAT(*h.value(0), WithinAbs(std::log(1.01) + std::log(1.02), 1e-14));
    }

    SECTION("Horizon one drops absent values only")
    {
        ReturnSeries r({"2020-01-01", "2020-01-02", "2020-01-03"}, {0.01, std::nullopt, 0.03});
        ReturnSeries h = returns::aggregate_to_horizon(r, ReturnType::SIMPLE, 1);
        REQUIRE(h.size() == 2);
        REQUIRE(h.date(1) == "2020-01-03");
    }

    SECTION("Partial windows are dropped")
    {
        ReturnSeries r = ReturnSeries::from_values({"2020-01-01", "2020-01-02", "2020-01-03"},
                                                   {0.01, 0.02, 0.03});
        ReturnSeries h = returns::aggregate_to_horizon(r, ReturnType::SIMPLE, 2);
        REQUIRE(h.size() == 2);
        REQUIRE(h.date(0) == "2020-01-02");
        REQUIRE(h.date(1) == "2020-01-03");

        REQUIRE(returns::aggregate_to_horizon(r, ReturnType::SIMPLE, 5).empty());
    }
}
