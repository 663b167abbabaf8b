/**
 * @file data_loader.hpp
 * @brief Price data loading and analysis configuration.
 *
 * Provides functionality to load price histories from CSV files and
 * engine settings from JSON files.
 */

#ifndef RISKCORE_DATA_DATA_LOADER_HPP
#define RISKCORE_DATA_DATA_LOADER_HPP

#include "analytics/risk_metrics_engine.hpp"
#include "backtest/var_backtest.hpp"
#include "data/price_history.hpp"
#include "risk/var_engine.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace riskcore
{

    /**
     * @struct DataConfig
     * @brief Price input and portfolio definition.
     */
    struct DataConfig
    {
        std::string data_file;             ///< Price CSV (wide or long format)
        std::string start_date;            ///< Inclusive start filter (empty = unbounded)
        std::string end_date;              ///< Inclusive end filter (empty = unbounded)
        std::vector<std::string> universe; ///< Tickers to load (all if empty)
        PortfolioWeights weights;          ///< Weight per symbol
        std::string benchmark;             ///< Benchmark ticker
        std::string benchmark_file;        ///< Benchmark price CSV (data_file if empty)

        /**
         * @brief Load from JSON object
         */
        static DataConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct VaRConfig
     * @brief Settings of a VaR computation as named in configuration.
     */
    struct VaRConfig
    {
        std::string method;          ///< historical, parametric, monte_carlo
        double confidence;           ///< Confidence level
        std::optional<int> lookback; ///< Most recent observations (all if absent)
        int mc_sims;                 ///< Monte Carlo simulations
        std::uint64_t seed;          ///< Monte Carlo seed
        std::string return_type;     ///< simple or log
        int horizon_days;            ///< Horizon in trading days
        std::string drift;           ///< ignore or include
        std::string parametric_dist; ///< normal or student_t
        std::string hs_weighting;    ///< none or ewma
        double hs_lambda;            ///< EWMA decay
        int rolling_window;          ///< Rolling VaR window (0 disables)
        std::optional<double> portfolio_value;

        static VaRConfig from_json(const nlohmann::json &j);

        /**
         * @brief Parse names into a typed request.
         * @throws InvalidParameterError for unknown names or invalid settings
         */
        risk::VaRRequest to_request() const;
    };

    /**
     * @struct RiskMetricsConfig
     * @brief Settings of the risk metrics report.
     */
    struct RiskMetricsConfig
    {
        std::vector<int> rolling_windows;
        double risk_free_rate;
        int annualization_days;
        std::string return_type;
        bool include_benchmark;

        static RiskMetricsConfig from_json(const nlohmann::json &j);

        analytics::RiskMetricsRequest to_request(const std::string &benchmark_symbol) const;
    };

    /**
     * @struct BacktestConfig
     * @brief Settings of a VaR backtest.
     */
    struct BacktestConfig
    {
        std::string method;
        double confidence;
        int lookback;
        int backtest_days;
        int mc_sims;
        std::uint64_t seed;
        std::string return_type; ///< Return definition for the backtested series

        static BacktestConfig from_json(const nlohmann::json &j);

        backtest::BacktestRequest to_request(bool verbose = false) const;
    };

    /**
     * @struct AnalysisConfig
     * @brief Complete analysis configuration
     */
    struct AnalysisConfig
    {
        DataConfig data;
        VaRConfig var;
        RiskMetricsConfig risk_metrics;
        BacktestConfig backtest;

        /**
         * @brief Load complete configuration from JSON file
         */
        static AnalysisConfig load_from_file(const std::string &config_path);
    };

    /**
     * @class DataLoader
     * @brief Loads and parses price histories
     *
     * Supports CSV files with standard formats:
     * - Format 1: date, ticker1, ticker2, ... (wide format)
     * - Format 2: date, ticker, price (long format)
     *
     * Empty, "nan" and unparsable cells become missing prices.
     */
    class DataLoader
    {
    public:
        DataLoader() = default;
        ~DataLoader() = default;

        // ====================================================================
        // CSV Loading Methods
        // ====================================================================

        /**
         * @brief Load prices from a wide CSV file
         *
         * Expected format:
         * date,AAPL,MSFT,JPM,...
         * 2020-01-01,150.0,200.0,120.0,...
         *
         * Rows are sorted by date; a repeated date keeps its last row.
         *
         * @param filepath Path to CSV file
         * @param tickers Optional list of tickers to load (loads all if empty)
         * @throws std::runtime_error if file cannot be loaded
         */
        static PriceHistory load_csv_wide(const std::string &filepath,
                                          const std::vector<std::string> &tickers = {});

        /**
         * @brief Load prices from a long CSV file
         *
         * Expected format:
         * date,ticker,price
         * 2020-01-01,AAPL,150.0
         *
         * @throws std::runtime_error if file cannot be loaded
         */
        static PriceHistory load_csv_long(const std::string &filepath,
                                          const std::vector<std::string> &tickers = {});

        /**
         * @brief Auto-detect CSV format and load
         */
        static PriceHistory load_csv(const std::string &filepath,
                                     const std::vector<std::string> &tickers = {});

        // ====================================================================
        // Configuration Loading
        // ====================================================================

        /**
         * @brief Load JSON file
         * @throws std::runtime_error if file cannot be opened or parsed
         */
        static nlohmann::json load_json(const std::string &filepath);

        static AnalysisConfig load_config(const std::string &config_path);

        // ====================================================================
        // Data Generation (for testing)
        // ====================================================================

        /**
         * @brief Generate a geometric random walk of weekday prices
         * @param tickers List of ticker symbols
         * @param num_days Number of trading days
         * @param start_date Starting date (YYYY-MM-DD)
         * @param volatility Daily volatility
         * @param drift Daily drift
         * @param seed Generator seed
         */
        static PriceHistory generate_synthetic_data(
            const std::vector<std::string> &tickers,
            size_t num_days,
            const std::string &start_date = "2020-01-01",
            double volatility = 0.02,
            double drift = 0.0005,
            unsigned int seed = 42);

        // ====================================================================
        // Export Methods
        // ====================================================================

        /**
         * @brief Save prices to CSV (wide format); missing cells are left empty
         */
        static void save_csv_wide(const PriceHistory &data, const std::string &filepath);

        /**
         * @brief Write a JSON document to a file
         */
        static void save_json(const nlohmann::json &document, const std::string &filepath);

    private:
        static std::vector<std::string> parse_csv_line(const std::string &line);
        static bool is_valid_date_format(const std::string &date);
        static std::string trim(const std::string &str);

        /**
         * @brief Convert string to double safely
         * @return Double value, or NaN if conversion fails
         */
        static double safe_stod(const std::string &str);

        /**
         * @brief Date after start_date by days_offset weekdays
         */
        static std::string add_weekdays(const std::string &start_date, int days_offset);
    };

} // namespace riskcore

#endif // RISKCORE_DATA_DATA_LOADER_HPP
