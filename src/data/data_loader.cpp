/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <random>
#include <set>
#include <sstream>

namespace riskcore
{

    namespace
    {
        // Days since 1970-01-01 for a proleptic Gregorian date
        long days_from_civil(int y, unsigned m, unsigned d)
        {
            y -= m <= 2 ? 1 : 0;
            const long era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<long>(doe) - 719468;
        }

        std::string civil_from_days(long z)
        {
            z += 719468;
            const long era = (z >= 0 ? z : z - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            const unsigned d = doy - (153 * mp + 2) / 5 + 1;
            const unsigned m = mp < 10 ? mp + 3 : mp - 9;
            const long y = static_cast<long>(yoe) + era * 400 + (m <= 2 ? 1 : 0);

            std::ostringstream oss;
            oss << std::setfill('0') << std::setw(4) << y << "-"
                << std::setw(2) << m << "-" << std::setw(2) << d;
            return oss.str();
        }

        // 0 = Sunday ... 6 = Saturday
        int weekday(long days)
        {
            return static_cast<int>(((days + 4) % 7 + 7) % 7);
        }

        bool is_weekend(long days)
        {
            int wd = weekday(days);
            return wd == 0 || wd == 6;
        }

        nlohmann::json section(const nlohmann::json &j, const char *key)
        {
            if (j.contains(key) && j[key].is_object())
            {
                return j[key];
            }
            return nlohmann::json::object();
        }
    } // anonymous namespace

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.data_file = j.value("data_file", "data/prices.csv");
        config.start_date = j.value("start_date", "");
        config.end_date = j.value("end_date", "");
        config.universe = j.value("universe", std::vector<std::string>{});
        config.weights = j.value("weights", PortfolioWeights{});
        config.benchmark = j.value("benchmark", "SPY");
        config.benchmark_file = j.value("benchmark_file", "");
        return config;
    }

    VaRConfig VaRConfig::from_json(const nlohmann::json &j)
    {
        VaRConfig config;
        config.method = j.value("method", "historical");
        config.confidence = j.value("confidence", 0.95);
        if (j.contains("lookback") && !j["lookback"].is_null())
        {
            config.lookback = j["lookback"].get<int>();
        }
        config.mc_sims = j.value("mc_sims", 10000);
        config.seed = j.value("seed", static_cast<std::uint64_t>(42));
        config.return_type = j.value("return_type", "simple");
        config.horizon_days = j.value("horizon_days", 1);
        config.drift = j.value("drift", "ignore");
        config.parametric_dist = j.value("parametric_dist", "normal");
        config.hs_weighting = j.value("hs_weighting", "none");
        config.hs_lambda = j.value("hs_lambda", 0.94);
        config.rolling_window = j.value("rolling_window", 250);
        if (j.contains("portfolio_value") && !j["portfolio_value"].is_null())
        {
            config.portfolio_value = j["portfolio_value"].get<double>();
        }
        return config;
    }

    risk::VaRRequest VaRConfig::to_request() const
    {
        risk::VaRRequest request;
        request.method = risk::make_var_method(method,
                                               risk::parse_weighting(hs_weighting),
                                               hs_lambda,
                                               risk::parse_distribution(parametric_dist),
                                               mc_sims,
                                               seed);
        request.confidence = confidence;
        request.lookback = lookback;
        request.return_type = parse_return_type(return_type);
        request.horizon_days = horizon_days;
        request.drift = risk::parse_drift(drift);
        request.portfolio_value = portfolio_value;
        request.rolling_window = rolling_window;
        return request;
    }

    RiskMetricsConfig RiskMetricsConfig::from_json(const nlohmann::json &j)
    {
        RiskMetricsConfig config;
        config.rolling_windows = j.value("rolling_windows", std::vector<int>{30, 90, 252});
        config.risk_free_rate = j.value("risk_free_rate", 0.0);
        config.annualization_days = j.value("annualization_days", 252);
        config.return_type = j.value("return_type", "log");
        config.include_benchmark = j.value("include_benchmark", true);
        return config;
    }

    analytics::RiskMetricsRequest RiskMetricsConfig::to_request(const std::string &benchmark_symbol) const
    {
        analytics::RiskMetricsRequest request;
        if (!benchmark_symbol.empty())
        {
            request.benchmark_symbol = benchmark_symbol;
        }
        request.rolling_windows = rolling_windows;
        request.risk_free_rate = risk_free_rate;
        request.annualization_days = annualization_days;
        request.return_type = parse_return_type(return_type);
        request.include_benchmark = include_benchmark;
        return request;
    }

    BacktestConfig BacktestConfig::from_json(const nlohmann::json &j)
    {
        BacktestConfig config;
        config.method = j.value("method", "historical");
        config.confidence = j.value("confidence", 0.95);
        config.lookback = j.value("lookback", 250);
        config.backtest_days = j.value("backtest_days", 250);
        config.mc_sims = j.value("mc_sims", 10000);
        config.seed = j.value("seed", static_cast<std::uint64_t>(42));
        config.return_type = j.value("return_type", "log");
        return config;
    }

    backtest::BacktestRequest BacktestConfig::to_request(bool verbose) const
    {
        backtest::BacktestRequest request;
        request.method = risk::make_var_method(method, risk::HistoricalWeighting::NONE, 0.94,
                                               risk::ParametricDistribution::NORMAL, mc_sims, seed);
        request.confidence = confidence;
        request.lookback = lookback;
        request.backtest_days = backtest_days;
        request.verbose = verbose;
        return request;
    }

    AnalysisConfig AnalysisConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // CSV Loading - Wide Format
    // ===========================

    PriceHistory DataLoader::load_csv_wide(const std::string &filepath,
                                           const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file");
        }

        auto header = parse_csv_line(line);
        if (header.empty() || trim(header[0]) != "date")
        {
            throw std::runtime_error("CSV must start with 'date' column");
        }

        std::vector<std::string> all_tickers;
        for (size_t i = 1; i < header.size(); ++i)
        {
            all_tickers.push_back(trim(header[i]));
        }

        // Determine which columns to load
        std::vector<size_t> column_indices;
        std::vector<std::string> selected_tickers;
        if (tickers.empty())
        {
            for (size_t i = 0; i < all_tickers.size(); ++i)
            {
                column_indices.push_back(i);
                selected_tickers.push_back(all_tickers[i]);
            }
        }
        else
        {
            for (const auto &ticker : tickers)
            {
                auto it = std::find(all_tickers.begin(), all_tickers.end(), ticker);
                if (it != all_tickers.end())
                {
                    column_indices.push_back(static_cast<size_t>(std::distance(all_tickers.begin(), it)));
                    selected_tickers.push_back(ticker);
                }
            }
            if (column_indices.empty())
            {
                throw std::runtime_error("None of the specified tickers found in CSV");
            }
        }

        // date -> row; std::map keeps rows sorted
        std::map<std::string, std::vector<double>> rows;
        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            std::string date = trim(fields[0]);
            if (!is_valid_date_format(date))
            {
                continue;
            }

            std::vector<double> row_prices;
            row_prices.reserve(column_indices.size());
            for (size_t idx : column_indices)
            {
                row_prices.push_back(idx + 1 < fields.size()
                                         ? safe_stod(fields[idx + 1])
                                         : std::numeric_limits<double>::quiet_NaN());
            }
            rows[date] = std::move(row_prices);
        }

        if (rows.empty())
        {
            throw std::runtime_error("No valid data found in CSV file");
        }

        std::vector<std::string> dates;
        Eigen::MatrixXd prices(static_cast<Eigen::Index>(rows.size()),
                               static_cast<Eigen::Index>(selected_tickers.size()));
        Eigen::Index r = 0;
        for (const auto &[date, values] : rows)
        {
            dates.push_back(date);
            for (size_t j = 0; j < values.size(); ++j)
            {
                prices(r, static_cast<Eigen::Index>(j)) = values[j];
            }
            ++r;
        }

        return PriceHistory(prices, dates, selected_tickers);
    }

    // ===========================
    // CSV Loading - Long Format
    // ===========================

    PriceHistory DataLoader::load_csv_long(const std::string &filepath,
                                           const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::map<std::string, std::map<std::string, double>> data_map; // date -> ticker -> price
        std::set<std::string> all_tickers;

        // Skip header
        std::getline(file, line);

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() < 3)
                continue;

            std::string date = trim(fields[0]);
            std::string ticker = trim(fields[1]);
            if (!is_valid_date_format(date))
                continue;

            if (!tickers.empty() &&
                std::find(tickers.begin(), tickers.end(), ticker) == tickers.end())
            {
                continue;
            }

            data_map[date][ticker] = safe_stod(fields[2]);
            all_tickers.insert(ticker);
        }

        if (data_map.empty() || all_tickers.empty())
        {
            throw std::runtime_error("No valid data found in CSV file");
        }

        std::vector<std::string> dates;
        std::vector<std::string> ticker_vec(all_tickers.begin(), all_tickers.end());
        Eigen::MatrixXd prices = Eigen::MatrixXd::Constant(static_cast<Eigen::Index>(data_map.size()),
                                                           static_cast<Eigen::Index>(ticker_vec.size()),
                                                           std::numeric_limits<double>::quiet_NaN());

        Eigen::Index r = 0;
        for (const auto &[date, by_ticker] : data_map)
        {
            dates.push_back(date);
            for (size_t j = 0; j < ticker_vec.size(); ++j)
            {
                auto it = by_ticker.find(ticker_vec[j]);
                if (it != by_ticker.end())
                {
                    prices(r, static_cast<Eigen::Index>(j)) = it->second;
                }
            }
            ++r;
        }

        return PriceHistory(prices, dates, ticker_vec);
    }

    // ========================
    // Auto-detect CSV Format
    // ========================

    PriceHistory DataLoader::load_csv(const std::string &filepath,
                                      const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::getline(file, line);
        file.close();

        auto header = parse_csv_line(line);

        // Wide format: date, ticker1, ticker2, ...
        // Long format: date, ticker, price
        if (header.size() == 3 &&
            (trim(header[1]) == "ticker" || trim(header[1]) == "symbol"))
        {
            return load_csv_long(filepath, tickers);
        }
        return load_csv_wide(filepath, tickers);
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }
        return j;
    }

    AnalysisConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        AnalysisConfig config;
        config.data = DataConfig::from_json(section(j, "data"));
        config.var = VaRConfig::from_json(section(j, "var"));
        config.risk_metrics = RiskMetricsConfig::from_json(section(j, "risk_metrics"));
        config.backtest = BacktestConfig::from_json(section(j, "backtest"));
        return config;
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    PriceHistory DataLoader::generate_synthetic_data(
        const std::vector<std::string> &tickers,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        unsigned int seed)
    {
        if (!is_valid_date_format(start_date))
        {
            throw InvalidParameterError("Start date must be YYYY-MM-DD, got: " + start_date);
        }

        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(drift, volatility);

        const Eigen::Index rows = static_cast<Eigen::Index>(num_days);
        const Eigen::Index cols = static_cast<Eigen::Index>(tickers.size());
        Eigen::MatrixXd prices(rows, cols);
        std::vector<std::string> dates;
        dates.reserve(num_days);

        for (size_t i = 0; i < num_days; ++i)
        {
            dates.push_back(add_weekdays(start_date, static_cast<int>(i)));
        }

        // Geometric random walk
        for (Eigen::Index j = 0; j < cols; ++j)
        {
            if (rows == 0)
                break;
            prices(0, j) = 100.0;
            for (Eigen::Index i = 1; i < rows; ++i)
            {
                prices(i, j) = prices(i - 1, j) * (1.0 + dist(gen));
            }
        }

        return PriceHistory(prices, dates, tickers);
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_csv_wide(const PriceHistory &data, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date";
        for (const auto &ticker : data.get_tickers())
        {
            file << "," << ticker;
        }
        file << "\n";

        const auto &dates = data.get_dates();
        for (size_t i = 0; i < dates.size(); ++i)
        {
            file << dates[i];
            for (size_t j = 0; j < data.num_assets(); ++j)
            {
                file << ",";
                if (auto p = data.price(i, j))
                {
                    file << std::fixed << std::setprecision(6) << *p;
                }
            }
            file << "\n";
        }
    }

    void DataLoader::save_json(const nlohmann::json &document, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }
        file << document.dump(2) << "\n";
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    bool DataLoader::is_valid_date_format(const std::string &date)
    {
        if (date.length() != 10)
            return false;
        if (date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }

        return true;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty())
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        char *end = nullptr;
        double value = std::strtod(trimmed.c_str(), &end);
        if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(value))
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return value;
    }

    std::string DataLoader::add_weekdays(const std::string &start_date, int days_offset)
    {
        long day = days_from_civil(std::stoi(start_date.substr(0, 4)),
                                   static_cast<unsigned>(std::stoi(start_date.substr(5, 2))),
                                   static_cast<unsigned>(std::stoi(start_date.substr(8, 2))));
        while (is_weekend(day))
        {
            ++day;
        }
        for (int i = 0; i < days_offset; ++i)
        {
            do
            {
                ++day;
            } while (is_weekend(day));
        }
        return civil_from_days(day);
    }

} // namespace riskcore
