/**
 * @file var_engine.cpp
 * @brief Implementation of the VaR/CVaR estimators and compute_var().
 */

#include "risk/var_engine.hpp"
#include "core/errors.hpp"
#include "core/json_utils.hpp"
#include "returns/returns_engine.hpp"
#include "risk/sample_covariance.hpp"
#include "stats/distributions.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

namespace riskcore
{
    namespace risk
    {

        namespace
        {
            /**
             * @brief Negative (weighted) mean of the sample at or below the quantile.
             *
             * Falls back to -quantile when the tail is empty or carries no weight.
             */
            double tail_loss(const std::vector<double> &values,
                             const std::vector<double> *weights,
                             double quantile_val)
            {
                double sum = 0.0;
                double denom = 0.0;
                for (size_t i = 0; i < values.size(); ++i)
                {
                    if (values[i] > quantile_val)
                    {
                        continue;
                    }
                    double w = weights ? std::max(0.0, (*weights)[i]) : 1.0;
                    sum += w * values[i];
                    denom += w;
                }
                if (denom <= 0.0)
                {
                    return -quantile_val;
                }
                return -(sum / denom);
            }

            /**
             * @brief Lower-triangular factor L with L L^T = cov.
             *
             * Cholesky when the matrix is positive definite; otherwise an
             * eigen-decomposition with negative eigenvalues clipped to zero.
             */
            Eigen::MatrixXd covariance_factor(const Eigen::MatrixXd &cov)
            {
                Eigen::LLT<Eigen::MatrixXd> llt(cov);
                if (llt.info() == Eigen::Success)
                {
                    return llt.matrixL();
                }

                Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(cov);
                if (solver.info() != Eigen::Success)
                {
                    throw std::runtime_error("Eigen-decomposition of the asset covariance failed");
                }
                Eigen::VectorXd roots = solver.eigenvalues().cwiseMax(0.0).cwiseSqrt();
                return solver.eigenvectors() * roots.asDiagonal();
            }

            nlohmann::json histogram_json(const stats::HistogramData &hist)
            {
                nlohmann::json j;
                j["bin_edges"] = json_utils::array(hist.bin_edges);
                j["counts"] = hist.counts;
                return j;
            }

            void validate_request(const VaRRequest &request)
            {
                validate_confidence(request.confidence);
                if (request.horizon_days < 1)
                {
                    throw InvalidParameterError(
                        "Expected positive value for parameter 'horizon_days', got: " + std::to_string(request.horizon_days));
                }
                if (request.lookback && *request.lookback < 1)
                {
                    throw InvalidParameterError(
                        "Expected positive value for parameter 'lookback', got: " + std::to_string(*request.lookback));
                }
                if (request.rolling_window < 0)
                {
                    throw InvalidParameterError(
                        "Expected non-negative value for parameter 'rolling_window', got: " + std::to_string(request.rolling_window));
                }
            }
        } // anonymous namespace

        // ===================================================================
        // Historical
        // ===================================================================

        VaREstimate historical_var_cvar(const std::vector<double> &returns,
                                        double confidence,
                                        const HistoricalMethod &method)
        {
            validate_confidence(confidence);
            if (returns.empty())
            {
                throw InsufficientDataError("Cannot compute historical VaR on an empty sample");
            }

            const double alpha = 1.0 - confidence;
            VaREstimate estimate;

            if (method.weighting == HistoricalWeighting::EWMA)
            {
                std::vector<double> weights = stats::ewma_weights(returns.size(), method.lambda);
                double q = stats::weighted_quantile(returns, weights, alpha);
                estimate.var = -q;
                estimate.cvar = tail_loss(returns, &weights, q);
            }
            else
            {
                double q = stats::quantile(returns, alpha);
                estimate.var = -q;
                estimate.cvar = tail_loss(returns, nullptr, q);
            }

            return estimate;
        }

        // ===================================================================
        // Parametric
        // ===================================================================

        ParametricEstimate parametric_var_cvar(const std::vector<double> &returns,
                                               double confidence,
                                               ParametricDistribution distribution,
                                               Drift drift,
                                               std::vector<std::string> &warnings)
        {
            validate_confidence(confidence);

            const double alpha = 1.0 - confidence;
            ParametricEstimate estimate;
            estimate.sigma = stats::sample_std(returns);
            estimate.mu = drift == Drift::INCLUDE ? stats::mean(returns) : 0.0;

            if (estimate.sigma <= 0.0)
            {
                warnings.push_back("Return volatility is zero; VaR set to 0.");
                return estimate;
            }

            if (distribution == ParametricDistribution::STUDENT_T)
            {
                stats::StudentTFit fit = stats::fit_student_t(returns);
                double z_alpha = stats::student_t_quantile(alpha, fit.df);

                estimate.var = -(fit.loc + fit.scale * z_alpha);
                if (fit.df <= 2.0)
                {
                    warnings.push_back("Student-t degrees of freedom <= 2; ES may be unstable.");
                }

                double es_mult = stats::student_t_pdf(z_alpha, fit.df) * (fit.df + z_alpha * z_alpha) / ((fit.df - 1.0) * alpha);
                estimate.cvar = -(fit.loc - fit.scale * es_mult);

                estimate.df = fit.df;
                estimate.loc = fit.loc;
                estimate.scale = fit.scale;
                return estimate;
            }

            double z_alpha = stats::inverse_normal_cdf(alpha);
            estimate.var = -(estimate.mu + estimate.sigma * z_alpha);
            estimate.cvar = -(estimate.mu - estimate.sigma * stats::normal_pdf(z_alpha) / alpha);
            return estimate;
        }

        // ===================================================================
        // Monte Carlo
        // ===================================================================

        MonteCarloEstimate monte_carlo_var_cvar(const AssetReturns &asset_returns,
                                                const PortfolioWeights &weights,
                                                double confidence,
                                                int horizon_days,
                                                const MonteCarloMethod &method,
                                                Drift drift)
        {
            validate_confidence(confidence);
            if (method.simulations < 1)
            {
                throw InvalidParameterError(
                    "Expected positive value for parameter 'mc_sims', got: " + std::to_string(method.simulations));
            }

            AssetReturns complete = asset_returns.complete_rows();
            if (complete.num_dates() < 2 || complete.num_assets() == 0)
            {
                throw InsufficientDataError(
                    "Monte Carlo needs at least 2 complete asset return rows, got: " + std::to_string(complete.num_dates()));
            }

            const int n_sims = std::min(method.simulations, MC_SIM_CAP);
            const double h = static_cast<double>(std::max(horizon_days, 1));

            Eigen::MatrixXd returns = complete.matrix();
            SampleCovariance model;
            Eigen::MatrixXd cov = model.estimate_covariance(returns) * h;
            Eigen::VectorXd mean = returns.colwise().mean().transpose();
            if (drift == Drift::IGNORE)
            {
                mean.setZero();
            }
            mean *= h;

            Eigen::VectorXd w = complete.weight_vector(weights);

            // Portfolio draw = w'mu + (L^T w)' z with z ~ N(0, I)
            Eigen::MatrixXd factor = covariance_factor(cov);
            Eigen::VectorXd loadings = factor.transpose() * w;
            const double mu_p = w.dot(mean);
            const Eigen::Index k = loadings.size();

            std::mt19937_64 generator(method.seed);
            std::normal_distribution<double> normal(0.0, 1.0);

            MonteCarloEstimate estimate;
            estimate.simulations = n_sims;
            estimate.simulated.resize(static_cast<size_t>(n_sims));
            for (int s = 0; s < n_sims; ++s)
            {
                double value = mu_p;
                for (Eigen::Index j = 0; j < k; ++j)
                {
                    value += loadings(j) * normal(generator);
                }
                estimate.simulated[static_cast<size_t>(s)] = value;
            }

            const double alpha = 1.0 - confidence;
            double q = stats::quantile(estimate.simulated, alpha);
            estimate.var = -q;
            estimate.cvar = tail_loss(estimate.simulated, nullptr, q);
            return estimate;
        }

        // ===================================================================
        // Component VaR
        // ===================================================================

        std::optional<std::vector<ComponentVaR>> component_var_normal(const AssetReturns &asset_returns,
                                                                      const PortfolioWeights &weights,
                                                                      double confidence,
                                                                      int horizon_days)
        {
            validate_confidence(confidence);

            AssetReturns complete = asset_returns.complete_rows();
            if (complete.num_dates() < 2 || complete.num_assets() == 0)
            {
                return std::nullopt;
            }

            SampleCovariance model;
            Eigen::MatrixXd cov = model.estimate_covariance(complete.matrix()) * static_cast<double>(std::max(horizon_days, 1));
            Eigen::VectorXd w = complete.weight_vector(weights);

            double portfolio_variance = w.dot(cov * w);
            if (!(portfolio_variance > 0.0))
            {
                return std::nullopt;
            }

            const double sigma_p = std::sqrt(portfolio_variance);
            const double z = -stats::inverse_normal_cdf(1.0 - confidence);
            Eigen::VectorXd marginal = z * (cov * w) / sigma_p;

            std::vector<ComponentVaR> rows;
            rows.reserve(complete.num_assets());
            for (size_t i = 0; i < complete.num_assets(); ++i)
            {
                const Eigen::Index idx = static_cast<Eigen::Index>(i);
                ComponentVaR row;
                row.symbol = complete.symbols()[i];
                row.weight = w(idx);
                row.marginal_var = marginal(idx);
                row.component_var = w(idx) * marginal(idx);
                rows.push_back(row);
            }
            return rows;
        }

        // ===================================================================
        // compute_var
        // ===================================================================

        VaRResult compute_var(const ReturnSeries &portfolio_returns,
                              const AssetReturns *asset_returns,
                              const PortfolioWeights *weights,
                              const VaRRequest &request)
        {
            validate_request(request);

            const size_t lookback = request.lookback
                                        ? static_cast<size_t>(*request.lookback)
                                        : portfolio_returns.size();
            ReturnSeries base = portfolio_returns.tail(lookback).dropna();

            std::optional<AssetReturns> base_assets;
            if (asset_returns)
            {
                base_assets = asset_returns->tail(lookback).complete_rows();
            }

            ReturnSeries aggregated = returns::aggregate_to_horizon(base, request.return_type, request.horizon_days);
            if (aggregated.empty())
            {
                throw InsufficientDataError("Insufficient return data for VaR calculation");
            }
            std::vector<double> sample = aggregated.observed_values();

            VaRResult result;
            result.method = method_name(request.method);
            result.confidence = request.confidence;
            result.returns = sample;
            result.histogram_realized = stats::build_histogram(sample);

            VaRMetadata &meta = result.metadata;
            meta.effective_n = static_cast<int>(sample.size());
            meta.horizon_days = request.horizon_days;
            meta.return_type = to_string(request.return_type);
            meta.drift = to_string(request.drift);

            if (sample.size() < 50)
            {
                result.warnings.push_back("Effective sample size < 50; results may be unstable.");
            }
            if (request.horizon_days > 1)
            {
                result.warnings.push_back("Horizon scaling uses rolling aggregation and sqrt(h) approximations.");
            }

            if (const auto *hist_method = std::get_if<HistoricalMethod>(&request.method))
            {
                meta.hs_weighting = to_string(hist_method->weighting);
                meta.hs_lambda = hist_method->lambda;

                VaREstimate estimate = historical_var_cvar(sample, request.confidence, *hist_method);
                result.var = estimate.var;
                result.cvar = estimate.cvar;
            }
            else if (const auto *param_method = std::get_if<ParametricMethod>(&request.method))
            {
                meta.parametric_dist = to_string(param_method->distribution);

                ParametricEstimate estimate = parametric_var_cvar(sample, request.confidence,
                                                                  param_method->distribution,
                                                                  request.drift, result.warnings);
                result.var = estimate.var;
                result.cvar = estimate.cvar;
                meta.mu = estimate.mu;
                meta.sigma = estimate.sigma;
                meta.df = estimate.df;
                meta.loc = estimate.loc;
                meta.scale = estimate.scale;

                if (base_assets && weights && !weights->empty())
                {
                    result.contributions = component_var_normal(*base_assets, *weights,
                                                                request.confidence, request.horizon_days);
                }
            }
            else
            {
                const auto &mc_method = std::get<MonteCarloMethod>(request.method);
                if (!base_assets || !weights)
                {
                    throw MissingInputError("Monte Carlo requires asset_returns and weights");
                }

                meta.seed = mc_method.seed;
                meta.mc_sims = std::min(mc_method.simulations, MC_SIM_CAP);

                MonteCarloEstimate estimate = monte_carlo_var_cvar(*base_assets, *weights, request.confidence,
                                                                   request.horizon_days, mc_method, request.drift);
                result.var = estimate.var;
                result.cvar = estimate.cvar;
                meta.simulations = estimate.simulations;
                meta.horizon_model = "mvn_scaled";
                result.histogram_simulated = stats::build_histogram(estimate.simulated);

                if (mc_method.simulations > MC_SIM_CAP)
                {
                    result.warnings.push_back("Monte Carlo sims capped to 200,000.");
                }
                if (mc_method.simulations < 5000)
                {
                    result.warnings.push_back("Monte Carlo simulations are below 5,000; results may be noisy.");
                }
            }

            result.histogram = result.histogram_simulated ? *result.histogram_simulated : result.histogram_realized;

            // Rolling path, historical and parametric only
            const bool rolling_method = !std::holds_alternative<MonteCarloMethod>(request.method);
            if (rolling_method && request.rolling_window > 0 &&
                base.size() > static_cast<size_t>(request.horizon_days) && sample.size() > 2)
            {
                const size_t n = sample.size();
                const size_t window = std::max<size_t>(
                    5, std::min<size_t>(static_cast<size_t>(request.rolling_window), std::max<size_t>(2, n / 2)));

                RollingVaR rolling;
                std::vector<std::string> scratch_warnings;
                for (size_t i = window; i < n; ++i)
                {
                    std::vector<double> window_returns(sample.begin() + static_cast<std::ptrdiff_t>(i - window),
                                                       sample.begin() + static_cast<std::ptrdiff_t>(i));
                    double window_var = 0.0;
                    try
                    {
                        if (const auto *hist_method = std::get_if<HistoricalMethod>(&request.method))
                        {
                            window_var = historical_var_cvar(window_returns, request.confidence, *hist_method).var;
                        }
                        else
                        {
                            const auto &param_method = std::get<ParametricMethod>(request.method);
                            window_var = parametric_var_cvar(window_returns, request.confidence,
                                                             param_method.distribution, request.drift,
                                                             scratch_warnings)
                                             .var;
                        }
                    }
                    catch (const std::exception &)
                    {
                        continue;
                    }
                    rolling.dates.push_back(aggregated.date(i - 1));
                    rolling.var_series.push_back(window_var);
                    rolling.realized.push_back(sample[i]);
                }

                if (!rolling.dates.empty())
                {
                    result.rolling = std::move(rolling);
                }
            }

            if (request.portfolio_value)
            {
                result.var_amount = result.var * *request.portfolio_value;
                result.cvar_amount = result.cvar * *request.portfolio_value;
            }

            return result;
        }

        // ===================================================================
        // Export
        // ===================================================================

        nlohmann::json to_json(const VaRResult &result)
        {
            nlohmann::json j;
            j["method"] = result.method;
            j["confidence"] = result.confidence;
            j["var"] = json_utils::number(result.var);
            j["cvar"] = json_utils::number(result.cvar);
            j["var_amount"] = json_utils::number(result.var_amount);
            j["cvar_amount"] = json_utils::number(result.cvar_amount);

            j["histogram"] = histogram_json(result.histogram);
            j["histogram_realized"] = histogram_json(result.histogram_realized);
            j["histogram_simulated"] = result.histogram_simulated
                                           ? histogram_json(*result.histogram_simulated)
                                           : nlohmann::json(nullptr);

            if (result.rolling)
            {
                j["rolling"]["dates"] = result.rolling->dates;
                j["rolling"]["var_series"] = json_utils::array(result.rolling->var_series);
                j["rolling"]["realized"] = json_utils::array(result.rolling->realized);
            }
            else
            {
                j["rolling"] = nullptr;
            }

            j["returns"] = json_utils::array(result.returns);
            j["warnings"] = result.warnings;

            const VaRMetadata &m = result.metadata;
            nlohmann::json meta;
            meta["effective_n"] = m.effective_n;
            meta["horizon_days"] = m.horizon_days;
            meta["return_type"] = m.return_type;
            meta["drift"] = m.drift;
            meta["covariance_method"] = m.covariance_method;
            meta["var_units"] = m.var_units;
            meta["horizon_model"] = m.horizon_model;
            if (m.hs_weighting)
            {
                meta["hs_weighting"] = *m.hs_weighting;
                meta["hs_lambda"] = json_utils::number(m.hs_lambda);
            }
            if (m.parametric_dist)
            {
                meta["parametric_dist"] = *m.parametric_dist;
                meta["mu"] = json_utils::number(m.mu);
                meta["sigma"] = json_utils::number(m.sigma);
                if (m.df)
                {
                    meta["df"] = json_utils::number(m.df);
                    meta["loc"] = json_utils::number(m.loc);
                    meta["scale"] = json_utils::number(m.scale);
                }
            }
            if (m.seed)
            {
                meta["seed"] = *m.seed;
                meta["mc_sims"] = *m.mc_sims;
                meta["simulations"] = m.simulations ? nlohmann::json(*m.simulations) : nlohmann::json(nullptr);
            }
            j["metadata"] = meta;

            if (result.contributions)
            {
                nlohmann::json rows = nlohmann::json::array();
                for (const auto &c : *result.contributions)
                {
                    rows.push_back({{"symbol", c.symbol},
                                    {"weight", json_utils::number(c.weight)},
                                    {"marginal_var", json_utils::number(c.marginal_var)},
                                    {"component_var", json_utils::number(c.component_var)}});
                }
                j["contributions_var"] = rows;
            }

            return j;
        }

        std::string summary(const VaRResult &result)
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Value at Risk\n";
            oss << "=============\n";
            oss << "  Method:              " << result.method << "\n";
            oss << "  Confidence:          " << std::setprecision(2) << result.confidence * 100.0 << "%\n";
            oss << "  Horizon (days):      " << result.metadata.horizon_days << "\n";
            oss << "  Observations:        " << result.metadata.effective_n << "\n";
            oss << "  VaR:                 " << std::setprecision(4) << result.var * 100.0 << "%\n";
            oss << "  CVaR:                " << std::setprecision(4) << result.cvar * 100.0 << "%\n";
            if (result.var_amount && result.cvar_amount)
            {
                oss << "  VaR amount:          " << std::setprecision(2) << *result.var_amount << "\n";
                oss << "  CVaR amount:         " << std::setprecision(2) << *result.cvar_amount << "\n";
            }

            if (result.contributions)
            {
                oss << "\nComponent VaR:\n";
                for (const auto &c : *result.contributions)
                {
                    oss << "  " << std::left << std::setw(10) << c.symbol << std::right
                        << " weight " << std::setprecision(4) << c.weight
                        << "  component " << std::setprecision(4) << c.component_var * 100.0 << "%\n";
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

    } // namespace risk
} // namespace riskcore
