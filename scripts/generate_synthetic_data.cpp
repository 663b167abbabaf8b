/**
 * @file generate_synthetic_data.cpp
 * @brief Generate a synthetic price file and configuration for riskcore_cli
 */

#include "analytics/performance_metrics.hpp"
#include "data/data_loader.hpp"
#include "returns/returns_engine.hpp"
#include "risk/sample_covariance.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>

using namespace riskcore;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Data Generator ===\n" << std::endl;

    // Portfolio assets plus the benchmark
    std::vector<std::string> tickers = {
        "AAPL", "MSFT", "JPM", "JNJ", "XOM", "SPY"
    };

    size_t num_days = 756;
    std::string start_date = "2021-01-04";

    std::string output_file = "data/market/prices.csv";
    double base_volatility = 0.015;
    double base_drift = 0.0003;
    unsigned int seed = 42;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_file = argv[++i];
        } else if (arg == "--volatility" && i + 1 < argc) {
            base_volatility = std::stod(argv[++i]);
        } else if (arg == "--drift" && i + 1 < argc) {
            base_drift = std::stod(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (arg == "--days" && i + 1 < argc) {
            num_days = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output FILE      Output CSV file (default: data/market/prices.csv)\n"
                      << "  --volatility VAL   Base daily volatility (default: 0.015)\n"
                      << "  --drift VAL        Base daily drift (default: 0.0003)\n"
                      << "  --seed N           Generator seed (default: 42)\n"
                      << "  --days N           Trading days (default: 756)\n"
                      << "  --help             Show this help\n";
            return 0;
        }
    }

    try {
        std::cout << "Generating " << num_days << " weekdays for "
                  << tickers.size() << " assets..." << std::endl;
        auto data = DataLoader::generate_synthetic_data(
            tickers, num_days, start_date, base_volatility, base_drift, seed);

        std::cout << "Saving to " << output_file << "..." << std::endl;
        DataLoader::save_csv_wide(data, output_file);

        std::cout << "\n=== Generated Data Summary ===\n";
        std::cout << "Dates: " << data.num_dates() << " ("
                  << data.get_dates().front() << " to "
                  << data.get_dates().back() << ")\n";

        AssetReturns returns = returns::compute_returns(data, ReturnType::LOG);

        std::cout << "\nAsset Statistics (Annualized):\n";
        std::cout << std::string(60, '-') << "\n";
        std::cout << std::setw(8) << "Ticker"
                  << std::setw(15) << "Return"
                  << std::setw(15) << "Volatility"
                  << std::setw(15) << "Max DD\n";
        std::cout << std::string(60, '-') << "\n";

        for (size_t i = 0; i < returns.num_assets(); ++i) {
            analytics::PerformanceMetrics metrics(returns.column(i).observed_values());
            std::cout << std::setw(8) << returns.symbols()[i]
                      << std::setw(14) << std::fixed << std::setprecision(2)
                      << metrics.annualized_return() * 100 << "%"
                      << std::setw(14) << metrics.annualized_volatility() * 100 << "%"
                      << std::setw(14) << metrics.max_drawdown() * 100 << "%\n";
        }
        std::cout << std::string(60, '-') << "\n";

        risk::SampleCovariance model;
        Eigen::MatrixXd corr = model.estimate_correlation(returns.complete_rows().matrix());
        double avg_corr = 0.0;
        int count = 0;
        for (Eigen::Index i = 0; i < corr.rows(); ++i) {
            for (Eigen::Index j = i + 1; j < corr.cols(); ++j) {
                avg_corr += corr(i, j);
                ++count;
            }
        }
        if (count > 0) {
            avg_corr /= count;
        }

        std::cout << "\nAverage pairwise correlation: "
                  << std::fixed << std::setprecision(3) << avg_corr << "\n";

        std::cout << "\nData generation complete.\n" << std::endl;
        std::cout << "You can now run:\n";
        std::cout << "  ./build/bin/riskcore_cli --config data/config/risk_config.json --verbose\n";
        std::cout << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
