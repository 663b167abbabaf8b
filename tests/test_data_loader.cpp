/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader, PriceHistory and the configuration structs
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/errors.hpp"
#include "data/csv_benchmark_provider.hpp"
#include "data/data_loader.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace riskcore;
using Catch::Matchers::WithinAbs;

namespace {

std::string write_temp_file(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

}

TEST_CASE("PriceHistory construction", "[PriceHistory]") {
    Eigen::MatrixXd prices(3, 2);
    prices << 100.0, 150.0,
              101.0, std::numeric_limits<double>::quiet_NaN(),
              102.0, 152.0;

    std::vector<std::string> dates = {"2020-01-01", "2020-01-02", "2020-01-03"};
    std::vector<std::string> tickers = {"AAPL", "MSFT"};

    SECTION("Accessors") {
        PriceHistory data(prices, dates, tickers);

        REQUIRE(data.num_dates() == 3);
        REQUIRE(data.num_assets() == 2);
        REQUIRE(data.get_dates() == dates);
        REQUIRE(data.get_tickers() == tickers);
        REQUIRE(data.has_ticker("MSFT"));
        REQUIRE_FALSE(data.has_ticker("JPM"));
    }

    SECTION("NaN cells surface as missing") {
        PriceHistory data(prices, dates, tickers);

        REQUIRE_FALSE(data.price(1, 1).has_value());
        REQUIRE(data.count_missing() == 1);
        REQUIRE_THAT(*data.get_price("AAPL", "2020-01-02"), WithinAbs(101.0, 1e-12));
        REQUIRE_THROWS_AS(data.get_price("JPM", "2020-01-02"), InvalidParameterError);
    }

    SECTION("Rejects unsorted dates") {
        std::vector<std::string> unsorted = {"2020-01-02", "2020-01-01", "2020-01-03"};
        REQUIRE_THROWS_AS(PriceHistory(prices, unsorted, tickers), InvalidParameterError);
    }

    SECTION("Rejects dimension mismatch") {
        REQUIRE_THROWS_AS(PriceHistory(prices, dates, {"AAPL"}), InvalidParameterError);
    }
}

TEST_CASE("PriceHistory filtering", "[PriceHistory]") {
    Eigen::MatrixXd prices(5, 2);
    prices << 100.0, 200.0,
              110.0, 210.0,
              105.0, 220.0,
              115.0, 215.0,
              120.0, 225.0;

    std::vector<std::string> dates = {"2020-01-01", "2020-01-02", "2020-01-03",
                                      "2020-01-06", "2020-01-07"};
    PriceHistory data(prices, dates, {"AAPL", "MSFT"});

    SECTION("Date range with bounds not in the table") {
        auto filtered = data.filter_by_date("2020-01-02", "2020-01-05");
        REQUIRE(filtered.num_dates() == 2);
        REQUIRE(filtered.get_dates().front() == "2020-01-02");
        REQUIRE(filtered.get_dates().back() == "2020-01-03");
    }

    SECTION("Empty bounds are unbounded") {
        REQUIRE(data.filter_by_date("", "").num_dates() == 5);
        REQUIRE(data.filter_by_date("2020-01-06", "").num_dates() == 2);
    }

    SECTION("Asset selection keeps requested order") {
        auto selected = data.select_assets({"MSFT", "AAPL"});
        REQUIRE(selected.get_tickers() == std::vector<std::string>{"MSFT", "AAPL"});
        REQUIRE_THAT(*selected.price(0, 0), WithinAbs(200.0, 1e-12));
        REQUIRE_THROWS_AS(data.select_assets({"XOM"}), InvalidParameterError);
    }
}

TEST_CASE("CSV loading", "[DataLoader]") {
    SECTION("Wide format sorts rows and keeps the last duplicate") {
        std::string path = write_temp_file("riskcore_wide.csv",
            "date,AAPL,MSFT\n"
            "2020-01-03,102.0,152.0\n"
            "2020-01-01,100.0,150.0\n"
            "2020-01-02,101.0,\n"
            "2020-01-03,103.0,nan\n");

        auto data = DataLoader::load_csv(path);
        REQUIRE(data.num_dates() == 3);
        REQUIRE(data.get_dates().front() == "2020-01-01");
        REQUIRE_THAT(*data.get_price("AAPL", "2020-01-03"), WithinAbs(103.0, 1e-12));
        REQUIRE_FALSE(data.get_price("MSFT", "2020-01-02").has_value());
        REQUIRE_FALSE(data.get_price("MSFT", "2020-01-03").has_value());
    }

    SECTION("Wide format ticker subset") {
        std::string path = write_temp_file("riskcore_subset.csv",
            "date,AAPL,MSFT,JPM\n"
            "2020-01-01,100.0,150.0,90.0\n"
            "2020-01-02,101.0,151.0,91.0\n");

        auto data = DataLoader::load_csv_wide(path, {"JPM"});
        REQUIRE(data.num_assets() == 1);
        REQUIRE(data.get_tickers().front() == "JPM");
        REQUIRE_THROWS(DataLoader::load_csv_wide(path, {"XOM"}));
    }

    SECTION("Long format is detected") {
        std::string path = write_temp_file("riskcore_long.csv",
            "date,ticker,price\n"
            "2020-01-01,AAPL,100.0\n"
            "2020-01-01,MSFT,150.0\n"
            "2020-01-02,AAPL,101.0\n");

        auto data = DataLoader::load_csv(path);
        REQUIRE(data.num_dates() == 2);
        REQUIRE(data.num_assets() == 2);
        REQUIRE_FALSE(data.get_price("MSFT", "2020-01-02").has_value());
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(DataLoader::load_csv("/nonexistent/prices.csv"), std::runtime_error);
    }

    SECTION("Round trip through save_csv_wide keeps missing cells") {
        Eigen::MatrixXd prices(2, 2);
        prices << 100.0, std::numeric_limits<double>::quiet_NaN(),
                  101.0, 151.0;
        PriceHistory data(prices, {"2020-01-01", "2020-01-02"}, {"AAPL", "MSFT"});

        auto path = (std::filesystem::temp_directory_path() / "riskcore_saved.csv").string();
        DataLoader::save_csv_wide(data, path);
        auto loaded = DataLoader::load_csv(path);

        REQUIRE(loaded.count_missing() == 1);
        REQUIRE_THAT(*loaded.get_price("MSFT", "2020-01-02"), WithinAbs(151.0, 1e-6));
    }
}

TEST_CASE("Configuration parsing", "[DataLoader][Config]") {
    SECTION("Defaults") {
        auto var = VaRConfig::from_json(nlohmann::json::object());
        REQUIRE(var.method == "historical");
        REQUIRE(var.return_type == "simple");
        REQUIRE(var.rolling_window == 250);
        REQUIRE(var.mc_sims == 10000);
        REQUIRE(var.seed == 42);
        REQUIRE_FALSE(var.lookback.has_value());
        REQUIRE_FALSE(var.portfolio_value.has_value());

        auto metrics = RiskMetricsConfig::from_json(nlohmann::json::object());
        REQUIRE(metrics.rolling_windows == std::vector<int>{30, 90, 252});
        REQUIRE(metrics.annualization_days == 252);
        REQUIRE(metrics.return_type == "log");

        auto bt = BacktestConfig::from_json(nlohmann::json::object());
        REQUIRE(bt.lookback == 250);
        REQUIRE(bt.backtest_days == 250);

        auto data = DataConfig::from_json(nlohmann::json::object());
        REQUIRE(data.benchmark == "SPY");
    }

    SECTION("VaR request from names") {
        nlohmann::json j = {{"method", "parametric"},
                            {"parametric_dist", "student_t"},
                            {"confidence", 0.99},
                            {"horizon_days", 10},
                            {"drift", "include"},
                            {"portfolio_value", 1e6}};
        auto request = VaRConfig::from_json(j).to_request();

        REQUIRE(std::holds_alternative<risk::ParametricMethod>(request.method));
        REQUIRE(std::get<risk::ParametricMethod>(request.method).distribution ==
                risk::ParametricDistribution::STUDENT_T);
        REQUIRE(request.horizon_days == 10);
        REQUIRE(request.drift == risk::Drift::INCLUDE);
        REQUIRE_THAT(*request.portfolio_value, WithinAbs(1e6, 1e-6));
    }

    SECTION("Unknown names are rejected") {
        REQUIRE_THROWS_AS(VaRConfig::from_json({{"method", "garch"}}).to_request(), InvalidParameterError);
        REQUIRE_THROWS_AS(VaRConfig::from_json({{"parametric_dist", "cauchy"}}).to_request(),
                          InvalidParameterError);
        REQUIRE_THROWS_AS(RiskMetricsConfig::from_json({{"return_type", "excess"}}).to_request("SPY"),
                          InvalidParameterError);
    }

    SECTION("Load complete configuration file") {
        std::string path = write_temp_file("riskcore_config.json", R"({
            "data": {"data_file": "prices.csv", "weights": {"AAPL": 0.6, "MSFT": 0.4}},
            "var": {"method": "monte_carlo", "mc_sims": 5000, "seed": 7},
            "backtest": {"lookback": 100}
        })");

        auto config = AnalysisConfig::load_from_file(path);
        REQUIRE(config.data.data_file == "prices.csv");
        REQUIRE_THAT(config.data.weights.at("AAPL"), WithinAbs(0.6, 1e-12));
        REQUIRE(config.var.method == "monte_carlo");
        REQUIRE(config.backtest.lookback == 100);
        REQUIRE(config.risk_metrics.include_benchmark);

        auto request = config.var.to_request();
        const auto& mc = std::get<risk::MonteCarloMethod>(request.method);
        REQUIRE(mc.simulations == 5000);
        REQUIRE(mc.seed == 7);
    }

    SECTION("Malformed JSON") {
        std::string path = write_temp_file("riskcore_bad.json", "{ not json");
        REQUIRE_THROWS_AS(DataLoader::load_json(path), std::runtime_error);
    }
}

TEST_CASE("Synthetic data generation", "[DataLoader]") {
    std::vector<std::string> tickers = {"AAPL", "MSFT", "SPY"};

    SECTION("Weekday calendar") {
        auto data = DataLoader::generate_synthetic_data(tickers, 7, "2020-01-03");
        REQUIRE(data.num_dates() == 7);
        // 2020-01-03 is a Friday; the weekend is skipped
        REQUIRE(data.get_dates()[0] == "2020-01-03");
        REQUIRE(data.get_dates()[1] == "2020-01-06");
        REQUIRE(data.get_dates()[6] == "2020-01-13");
    }

    SECTION("Weekend start rolls forward") {
        auto data = DataLoader::generate_synthetic_data(tickers, 2, "2020-02-29");
        REQUIRE(data.get_dates()[0] == "2020-03-02");
    }

    SECTION("Seeded generation is reproducible") {
        auto a = DataLoader::generate_synthetic_data(tickers, 50, "2020-01-01", 0.02, 0.0, 11);
        auto b = DataLoader::generate_synthetic_data(tickers, 50, "2020-01-01", 0.02, 0.0, 11);
        REQUIRE(*a.price(49, 2) == *b.price(49, 2));
        REQUIRE_THAT(*a.price(0, 0), WithinAbs(100.0, 1e-12));
    }
}

TEST_CASE("CSV benchmark provider", "[DataLoader][Benchmark]") {
    Eigen::MatrixXd prices(4, 2);
    prices << 100.0, 50.0,
              110.0, 55.0,
              121.0, 55.0,
              133.1, 60.5;
    PriceHistory data(prices, {"2020-01-01", "2020-01-02", "2020-01-03", "2020-01-06"},
                      {"SPY", "AAPL"});
    CsvBenchmarkProvider provider(data);

    SECTION("Returns from the first in-range date") {
        auto bench = provider.fetch_returns("SPY", "2020-01-02", "2020-01-06", ReturnType::SIMPLE);
        REQUIRE(bench.has_value());
        REQUIRE(bench->size() == 3);
        REQUIRE(bench->date(0) == "2020-01-02");
        REQUIRE_THAT(*bench->value(0), WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(*bench->value(2), WithinAbs(0.10, 1e-12));
    }

    SECTION("Unknown symbol is a failed fetch") {
        REQUIRE_FALSE(provider.fetch_returns("QQQ", "", "", ReturnType::LOG).has_value());
    }

    SECTION("Range without returns is a failed fetch") {
        REQUIRE_FALSE(provider.fetch_returns("SPY", "2021-01-01", "", ReturnType::LOG).has_value());
    }
}
