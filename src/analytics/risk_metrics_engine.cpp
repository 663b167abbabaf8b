/**
 * @file risk_metrics_engine.cpp
 * @brief Implementation of compute_risk_metrics() and its exporters.
 */

#include "analytics/risk_metrics_engine.hpp"
#include "analytics/performance_metrics.hpp"
#include "core/errors.hpp"
#include "core/json_utils.hpp"
#include "risk/sample_covariance.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace riskcore
{
    namespace analytics
    {

        namespace
        {
            void validate_request(const RiskMetricsRequest &request)
            {
                if (request.annualization_days < 1)
                {
                    throw InvalidParameterError(
                        "Expected positive value for parameter 'annualization_days', got: " + std::to_string(request.annualization_days));
                }
                for (int window : request.rolling_windows)
                {
                    if (window < 2)
                    {
                        throw InvalidParameterError(
                            "Expected window_days >= 2 for rolling statistics, got: " + std::to_string(window));
                    }
                }
            }

            /**
             * @brief Fetch benchmark returns, mapping a provider exception to
             *        a failed fetch.
             */
            std::optional<ReturnSeries> fetch_benchmark(const BenchmarkProvider &provider,
                                                        const std::string &symbol,
                                                        const ReturnSeries &portfolio,
                                                        ReturnType type)
            {
                try
                {
                    return provider.fetch_returns(symbol, portfolio.dates().front(),
                                                  portfolio.dates().back(), type);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Warning: failed to fetch benchmark " << symbol << ": " << e.what() << std::endl;
                    return std::nullopt;
                }
            }

            /**
             * @brief Benchmark values re-indexed on the portfolio dates.
             */
            std::vector<std::optional<double>> align_path(const std::vector<std::string> &dates,
                                                          const ReturnSeries &benchmark,
                                                          const std::vector<double> &path)
            {
                std::vector<std::optional<double>> out;
                out.reserve(dates.size());
                for (const auto &date : dates)
                {
                    int idx = benchmark.find_date(date);
                    if (idx < 0)
                    {
                        out.emplace_back(std::nullopt);
                    }
                    else
                    {
                        out.emplace_back(path[static_cast<size_t>(idx)]);
                    }
                }
                return out;
            }

            nlohmann::json rolling_json(const RollingSeries &series, const std::string &prefix)
            {
                nlohmann::json j;
                j["dates"] = series.dates;
                for (int window : series.windows)
                {
                    auto it = series.values.find(window);
                    j[prefix + std::to_string(window)] = it == series.values.end()
                                                             ? nlohmann::json::array()
                                                             : json_utils::array(it->second);
                }
                return j;
            }

            nlohmann::json path_json(const PathSeries &path)
            {
                nlohmann::json j;
                j["dates"] = path.dates;
                j["portfolio"] = json_utils::array(path.portfolio);
                if (path.benchmark)
                {
                    j["benchmark"] = json_utils::array(*path.benchmark);
                }
                return j;
            }
        } // anonymous namespace

        // ===================================================================
        // compute_risk_metrics
        // ===================================================================

        RiskMetricsResult compute_risk_metrics(const ReturnSeries &portfolio_returns,
                                               const AssetReturns &asset_returns,
                                               const PortfolioWeights &weights,
                                               const RiskMetricsRequest &request,
                                               const BenchmarkProvider *benchmark_provider)
        {
            validate_request(request);

            const int ann_days = request.annualization_days;
            ReturnSeries port = portfolio_returns.dropna();
            if (port.empty())
            {
                throw InsufficientDataError("No portfolio returns available for risk metrics");
            }

            RiskMetricsResult result;
            const int effective_days = static_cast<int>(port.size());
            if (effective_days < 50)
            {
                result.warnings.push_back("Effective sample size (" + std::to_string(effective_days) +
                                          ") < 50; results may be unstable.");
            }

            // Point metrics
            PerformanceMetrics metrics(port.observed_values(), request.risk_free_rate, ann_days, request.return_type);

            RiskSummary &summary_block = result.summary;
            summary_block.ann_vol = metrics.annualized_volatility();
            summary_block.ann_return = metrics.annualized_return();
            summary_block.sharpe_ratio = metrics.sharpe_ratio();
            summary_block.sortino_ratio = metrics.sortino_ratio();
            summary_block.max_drawdown = metrics.max_drawdown();
            summary_block.dd_duration_days = metrics.max_drawdown_duration();

            TailStats tail;
            tail.skew = metrics.skewness();
            tail.kurtosis = metrics.kurtosis();
            tail.best_day = metrics.best_day();
            tail.worst_day = metrics.worst_day();
            tail.hit_ratio = metrics.hit_ratio();
            tail.downside_dev_ann = metrics.downside_deviation();
            tail.calmar_ratio = metrics.calmar_ratio();
            result.stats = tail;

            result.cumulative_returns.dates = port.dates();
            result.cumulative_returns.portfolio = metrics.cumulative_returns();
            result.drawdown_series.dates = port.dates();
            result.drawdown_series.portfolio = metrics.drawdowns();

            // Benchmark
            if (request.include_benchmark && request.benchmark_symbol && !request.benchmark_symbol->empty())
            {
                const std::string &symbol = *request.benchmark_symbol;
                std::optional<ReturnSeries> bench;
                if (benchmark_provider)
                {
                    bench = fetch_benchmark(*benchmark_provider, symbol, port, request.return_type);
                }

                if (bench && bench->valid_count() > MIN_BENCHMARK_OBSERVATIONS)
                {
                    AlignedReturns aligned = align_returns(port, *bench);
                    if (aligned.dates.size() < 50)
                    {
                        result.warnings.push_back("Benchmark overlap < 50 days; TE/IR may be unstable.");
                    }

                    result.benchmark = benchmark_statistics(port, *bench, ann_days);
                    if (result.benchmark)
                    {
                        summary_block.beta = result.benchmark->beta;
                        if (result.benchmark->tracking_error_ann == 0.0)
                        {
                            result.warnings.push_back("Tracking error is zero; information ratio undefined");
                        }
                    }

                    ReturnSeries bench_clean = bench->dropna();
                    std::vector<double> bench_values = bench_clean.observed_values();
                    result.cumulative_returns.benchmark =
                        align_path(port.dates(), bench_clean, cumulative_growth(bench_values, request.return_type));
                    result.drawdown_series.benchmark =
                        align_path(port.dates(), bench_clean, drawdown_series(bench_values, request.return_type));
                }
                else
                {
                    result.warnings.push_back("Benchmark " + symbol + " has insufficient overlap with portfolio.");
                }
            }

            // Asset alignment and cleaning
            AssetReturns aligned_assets = asset_returns.align_to(port.dates()).drop_empty_rows();
            std::vector<std::string> symbols;
            AssetReturns clean;
            if (aligned_assets.num_dates() == 0)
            {
                result.warnings.push_back("No aligned asset return data available.");
            }
            else
            {
                std::vector<std::string> dropped;
                for (size_t j = 0; j < aligned_assets.num_assets(); ++j)
                {
                    if (aligned_assets.missing_fraction(j) > MAX_ASSET_MISSING_FRACTION)
                    {
                        const std::string &sym = aligned_assets.symbols()[j];
                        dropped.push_back(sym);
                        result.warnings.push_back("Asset " + sym +
                                                  " has >20% missing returns after alignment; dropped from covariance.");
                    }
                }
                clean = aligned_assets.drop_columns(dropped).complete_rows();
                symbols = clean.symbols();
            }

            if (clean.num_dates() < 50)
            {
                result.warnings.push_back(
                    "Clean aligned asset return sample < 50 rows; correlations/contributions may be unstable.");
            }

            // Correlation and contributions
            const Eigen::Index k = static_cast<Eigen::Index>(symbols.size());
            Eigen::MatrixXd cov_ann = Eigen::MatrixXd::Constant(k, k, std::numeric_limits<double>::quiet_NaN());
            Eigen::MatrixXd corr = cov_ann;
            if (k > 0 && clean.num_dates() >= 2)
            {
                risk::SampleCovariance model;
                Eigen::MatrixXd cov = model.estimate_covariance(clean.matrix());
                corr = risk::RiskModel::covariance_to_correlation(cov);
                cov_ann = cov * static_cast<double>(ann_days);
            }

            result.correlation.symbols = symbols;
            result.correlation.matrix = corr;

            Eigen::VectorXd w = k > 0 ? clean.weight_vector(weights) : Eigen::VectorXd();
            result.contributions = risk_contributions(cov_ann, symbols, w);

            // Rolling series
            result.rolling_vol = rolling_volatility(port, request.rolling_windows, ann_days);
            result.rolling_sharpe = rolling_sharpe(port, request.rolling_windows, metrics.daily_risk_free(), ann_days);

            RiskMetadata &meta = result.metadata;
            meta.annualization_days = ann_days;
            meta.return_type = to_string(request.return_type);
            meta.effective_days = effective_days;
            meta.symbols = symbols;
            if (request.include_benchmark)
            {
                meta.benchmark_symbol = request.benchmark_symbol;
            }
            meta.risk_free_rate = request.risk_free_rate;

            return result;
        }

        // ===================================================================
        // Export
        // ===================================================================

        nlohmann::json to_json(const RiskMetricsResult &result)
        {
            nlohmann::json j;

            const RiskSummary &s = result.summary;
            j["summary"] = {{"ann_vol", json_utils::number(s.ann_vol)},
                            {"ann_return", json_utils::number(s.ann_return)},
                            {"max_drawdown", json_utils::number(s.max_drawdown)},
                            {"dd_duration_days", s.dd_duration_days},
                            {"sharpe_ratio", json_utils::number(s.sharpe_ratio)},
                            {"sortino_ratio", json_utils::number(s.sortino_ratio)},
                            {"beta", json_utils::number(s.beta)}};

            j["rolling_vol"] = rolling_json(result.rolling_vol, "vol_");
            j["rolling_sharpe"] = rolling_json(result.rolling_sharpe, "sharpe_");

            nlohmann::json matrix = nlohmann::json::array();
            for (Eigen::Index r = 0; r < result.correlation.matrix.rows(); ++r)
            {
                nlohmann::json row = nlohmann::json::array();
                for (Eigen::Index c = 0; c < result.correlation.matrix.cols(); ++c)
                {
                    row.push_back(json_utils::number(result.correlation.matrix(r, c)));
                }
                matrix.push_back(row);
            }
            j["correlation"] = {{"symbols", result.correlation.symbols}, {"matrix", matrix}};

            nlohmann::json contributions = nlohmann::json::array();
            for (const auto &c : result.contributions)
            {
                contributions.push_back({{"symbol", c.symbol},
                                         {"weight", json_utils::number(c.weight)},
                                         {"mctr", json_utils::number(c.mctr)},
                                         {"cctr", json_utils::number(c.cctr)},
                                         {"pct_cctr", json_utils::number(c.pct_cctr)}});
            }
            j["contributions"] = contributions;

            j["cumulative_returns"] = path_json(result.cumulative_returns);
            j["drawdown_series"] = path_json(result.drawdown_series);

            if (result.stats)
            {
                const TailStats &t = *result.stats;
                j["stats"] = {{"skew", json_utils::number(t.skew)},
                              {"kurtosis", json_utils::number(t.kurtosis)},
                              {"best_day", json_utils::number(t.best_day)},
                              {"worst_day", json_utils::number(t.worst_day)},
                              {"hit_ratio", json_utils::number(t.hit_ratio)},
                              {"downside_dev_ann", json_utils::number(t.downside_dev_ann)},
                              {"calmar_ratio", json_utils::number(t.calmar_ratio)}};
            }
            else
            {
                j["stats"] = nlohmann::json::object();
            }

            if (result.benchmark)
            {
                const BenchmarkStats &b = *result.benchmark;
                j["benchmark"] = {{"beta", json_utils::number(b.beta)},
                                  {"alpha_ann", json_utils::number(b.alpha_ann)},
                                  {"r2", json_utils::number(b.r2)},
                                  {"corr", json_utils::number(b.corr)},
                                  {"tracking_error_ann", json_utils::number(b.tracking_error_ann)},
                                  {"information_ratio", json_utils::number(b.information_ratio)}};
            }

            const RiskMetadata &m = result.metadata;
            j["metadata"] = {{"annualization_days", m.annualization_days},
                             {"return_type", m.return_type},
                             {"effective_days", m.effective_days},
                             {"symbols", m.symbols},
                             {"benchmark_symbol", m.benchmark_symbol ? nlohmann::json(*m.benchmark_symbol) : nlohmann::json(nullptr)},
                             {"risk_free_rate", m.risk_free_rate}};

            j["warnings"] = result.warnings;
            return j;
        }

        std::string summary(const RiskMetricsResult &result)
        {
            std::ostringstream oss;
            oss << std::fixed;

            const RiskSummary &s = result.summary;
            oss << "Risk Metrics\n";
            oss << "============\n";
            oss << "  Observations:        " << result.metadata.effective_days << "\n";
            oss << "  Annualized Return:   " << std::setprecision(4) << s.ann_return * 100.0 << "%\n";
            oss << "  Annualized Vol:      " << std::setprecision(4) << s.ann_vol * 100.0 << "%\n";
            oss << "  Sharpe Ratio:        " << std::setprecision(4) << s.sharpe_ratio << "\n";
            oss << "  Sortino Ratio:       ";
            if (std::isfinite(s.sortino_ratio))
            {
                oss << std::setprecision(4) << s.sortino_ratio << "\n";
            }
            else
            {
                oss << "n/a\n";
            }
            oss << "  Max Drawdown:        " << std::setprecision(4) << s.max_drawdown * 100.0 << "%\n";
            oss << "  Drawdown (days):     " << s.dd_duration_days << "\n";
            if (s.beta)
            {
                oss << "  Beta:                " << std::setprecision(4) << *s.beta << "\n";
            }

            if (result.benchmark)
            {
                const BenchmarkStats &b = *result.benchmark;
                oss << "\nBenchmark (" << result.metadata.benchmark_symbol.value_or("") << "):\n";
                oss << "  Alpha (ann.):        " << std::setprecision(4) << b.alpha_ann * 100.0 << "%\n";
                oss << "  R-squared:           " << std::setprecision(4) << b.r2 << "\n";
                oss << "  Tracking Error:      " << std::setprecision(4) << b.tracking_error_ann * 100.0 << "%\n";
                if (b.information_ratio)
                {
                    oss << "  Information Ratio:   " << std::setprecision(4) << *b.information_ratio << "\n";
                }
            }

            if (!result.contributions.empty())
            {
                oss << "\nRisk Contributions:\n";
                for (const auto &c : result.contributions)
                {
                    oss << "  " << std::left << std::setw(10) << c.symbol << std::right
                        << " weight " << std::setprecision(4) << c.weight
                        << "  share " << std::setprecision(2) << c.pct_cctr * 100.0 << "%\n";
                }
            }

            if (!result.warnings.empty())
            {
                oss << "\nWarnings:\n";
                for (const auto &w : result.warnings)
                {
                    oss << "  - " << w << "\n";
                }
            }

            return oss.str();
        }

    } // namespace analytics
} // namespace riskcore
