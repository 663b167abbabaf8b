/**
 * @file main.cpp
 * @brief Main entry point for the riskcore command-line tool
 *
 * Loads configuration and prices, builds asset and portfolio returns, runs
 * the VaR, risk metrics and backtest engines, and writes a JSON report.
 */

#include "analytics/risk_metrics_engine.hpp"
#include "backtest/var_backtest.hpp"
#include "core/errors.hpp"
#include "data/csv_benchmark_provider.hpp"
#include "data/data_loader.hpp"
#include "returns/returns_engine.hpp"
#include "risk/var_engine.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

using namespace riskcore;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "riskcore v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --command NAME        var, risk, backtest or all (default: all)\n"
              << "  --output PATH         Path to JSON report (default: results/report.json)\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/risk_config.json --command var\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string command = "all";
    std::string output_path = "results/report.json";
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--command" && i + 1 < argc)
            {
                args.command = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty() &&
               (command == "all" || command == "var" || command == "risk" || command == "backtest");
    }

    bool runs(const std::string &name) const
    {
        return command == "all" || command == name;
    }
};

/**
 * @brief Asset universe: configured tickers, else weighted symbols, else
 *        every loaded column except the benchmark.
 */
std::vector<std::string> resolve_universe(const AnalysisConfig &config, const PriceHistory &all_prices)
{
    if (!config.data.universe.empty())
    {
        return config.data.universe;
    }

    std::vector<std::string> universe;
    if (!config.data.weights.empty())
    {
        for (const auto &[symbol, weight] : config.data.weights)
        {
            if (all_prices.has_ticker(symbol))
            {
                universe.push_back(symbol);
            }
        }
        return universe;
    }

    for (const auto &ticker : all_prices.get_tickers())
    {
        if (ticker != config.data.benchmark)
        {
            universe.push_back(ticker);
        }
    }
    return universe;
}

/**
 * @brief Configured weights, or equal weights over the universe.
 */
PortfolioWeights resolve_weights(const AnalysisConfig &config, const std::vector<std::string> &universe)
{
    if (!config.data.weights.empty())
    {
        return config.data.weights;
    }

    PortfolioWeights weights;
    for (const auto &symbol : universe)
    {
        weights[symbol] = 1.0 / static_cast<double>(universe.size());
    }
    return weights;
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        auto config = DataLoader::load_config(args.config_path);

        // ====================================================================
        // 2. Load Prices
        // ====================================================================
        std::cout << "[2/4] Loading prices..." << std::endl;

        PriceHistory all_prices = DataLoader::load_csv(config.data.data_file)
                                      .filter_by_date(config.data.start_date, config.data.end_date);
        std::vector<std::string> universe = resolve_universe(config, all_prices);
        if (universe.empty())
        {
            throw InvalidParameterError("No assets to analyse in " + config.data.data_file);
        }
        PriceHistory prices = all_prices.select_assets(universe);
        PortfolioWeights weights = resolve_weights(config, universe);

        std::cout << "  - Loaded " << prices.num_dates() << " dates, "
                  << prices.num_assets() << " assets" << std::endl;

        if (args.verbose)
        {
            prices.print_summary();
        }

        std::unique_ptr<CsvBenchmarkProvider> benchmark_provider;
        if (!config.data.benchmark_file.empty())
        {
            benchmark_provider = std::make_unique<CsvBenchmarkProvider>(
                CsvBenchmarkProvider::from_file(config.data.benchmark_file));
        }
        else
        {
            benchmark_provider = std::make_unique<CsvBenchmarkProvider>(all_prices);
        }

        // ====================================================================
        // 3. Run Engines
        // ====================================================================
        std::cout << "[3/4] Running risk engines..." << std::endl;

        nlohmann::json report;

        if (args.runs("var"))
        {
            risk::VaRRequest request = config.var.to_request();
            AssetReturns asset_returns = returns::compute_returns(prices, request.return_type);
            ReturnSeries portfolio = returns::portfolio_returns(asset_returns, weights);

            risk::VaRResult result = risk::compute_var(portfolio, &asset_returns, &weights, request);
            std::cout << "\n"
                      << risk::summary(result) << std::endl;
            report["var"] = risk::to_json(result);
        }

        if (args.runs("risk"))
        {
            analytics::RiskMetricsRequest request = config.risk_metrics.to_request(config.data.benchmark);
            AssetReturns asset_returns = returns::compute_returns(prices, request.return_type);
            ReturnSeries portfolio = returns::portfolio_returns(asset_returns, weights);

            analytics::RiskMetricsResult result =
                analytics::compute_risk_metrics(portfolio, asset_returns, weights, request,
                                                benchmark_provider.get());
            std::cout << "\n"
                      << analytics::summary(result) << std::endl;
            report["risk_metrics"] = analytics::to_json(result);
        }

        if (args.runs("backtest"))
        {
            backtest::BacktestRequest request = config.backtest.to_request(args.verbose);
            AssetReturns asset_returns =
                returns::compute_returns(prices, parse_return_type(config.backtest.return_type));
            ReturnSeries portfolio = returns::portfolio_returns(asset_returns, weights);

            backtest::BacktestResult result =
                backtest::backtest_var(portfolio, &asset_returns, &weights, request);
            std::cout << "\n"
                      << backtest::summary(result) << std::endl;
            report["backtest"] = backtest::to_json(result);
        }

        // ====================================================================
        // 4. Export
        // ====================================================================
        std::cout << "[4/4] Writing report..." << std::endl;

        DataLoader::save_json(report, args.output_path);
        std::cout << "  - Report written to: " << args.output_path << std::endl;

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Analysis completed successfully in " << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (!args.is_valid())
    {
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    return run(args);
}
