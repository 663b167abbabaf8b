/**
 * @file test_var_engine.cpp
 * @brief Tests for historical, parametric and Monte Carlo VaR/CVaR
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "risk/var_engine.hpp"
#include "stats/distributions.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <random>

using namespace riskcore;
using namespace riskcore::risk;
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

    std::vector<double> normal_sample(size_t n, double mu, double sigma, unsigned seed)
    {
        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(mu, sigma);
        std::vector<double> out(n);
        for (auto &v : out)
        {
            v = dist(gen);
        }
        return out;
    }

    /** Two correlated assets and a 60/40 portfolio of them. */
    struct TwoAssetFixture
    {
        AssetReturns assets;
        PortfolioWeights weights{{"AAA", 0.6}, {"BBB", 0.4}};
        ReturnSeries portfolio;

        TwoAssetFixture()
        {
            const size_t n = 500;
            std::mt19937 gen(7);
            std::normal_distribution<double> z(0.0, 1.0);
            Eigen::MatrixXd values(n, 2);
            std::vector<double> port(n);
            for (size_t i = 0; i < n; ++i)
            {
                double z1 = z(gen);
                double z2 = z(gen);
                values(i, 0) = 0.0004 + 0.012 * z1;
                values(i, 1) = 0.0002 + 0.020 * (0.5 * z1 + std::sqrt(0.75) * z2);
                port[i] = 0.6 * values(i, 0) + 0.4 * values(i, 1);
            }
            auto dates = make_dates(n);
            assets = AssetReturns::from_matrix(dates, {"AAA", "BBB"}, values);
            portfolio = ReturnSeries::from_values(dates, port);
        }
    };
}

TEST_CASE("Historical VaR", "[VaR][Historical]")
{
    std::vector<double> r;
    for (int i = 1; i <= 100; ++i)
    {
        r.push_back(static_cast<double>(i - 51) / 1000.0); // -0.050 ... 0.049
    }

    SECTION("Empirical quantile and tail mean")
    {
        VaREstimate est = historical_var_cvar(r, 0.95);
        // 5% quantile with linear interpolation: position 4.95
        REQUIRE_THAT(est.var, WithinAbs(0.04505, 1e-12));
        // Observations at or below the quantile: -0.050 ... -0.046
        REQUIRE_THAT(est.cvar, WithinAbs(0.048, 1e-12));
        REQUIRE(est.cvar >= est.var);
    }

    SECTION("EWMA weighting emphasises recent losses")
    {
        std::vector<double> calm_then_stressed = normal_sample(250, 0.0, 0.005, 3);
        auto stressed = normal_sample(30, 0.0, 0.03, 4);
        calm_then_stressed.insert(calm_then_stressed.end(), stressed.begin(), stressed.end());

        VaREstimate plain = historical_var_cvar(calm_then_stressed, 0.99);
        VaREstimate ewma = historical_var_cvar(calm_then_stressed, 0.99,
                                               HistoricalMethod{HistoricalWeighting::EWMA, 0.94});
        REQUIRE(ewma.var > plain.var);
    }

    SECTION("Invalid input")
    {
        REQUIRE_THROWS_AS(historical_var_cvar({}, 0.95), InsufficientDataError);
        REQUIRE_THROWS_AS(historical_var_cvar(r, 1.0), InvalidParameterError);
        REQUIRE_THROWS_AS(historical_var_cvar(r, 0.0), InvalidParameterError);
    }
}

TEST_CASE("Parametric VaR", "[VaR][Parametric]")
{
    std::vector<std::string> warnings;

    SECTION("Normal closed form")
    {
        std::vector<double> r = normal_sample(1000, 0.001, 0.01, 11);
        double sigma = stats::sample_std(r);
        double z = stats::inverse_normal_cdf(0.05);

        ParametricEstimate est = parametric_var_cvar(r, 0.95, ParametricDistribution::NORMAL,
                                                     Drift::IGNORE, warnings);
        REQUIRE_THAT(est.var, WithinAbs(-sigma * z, 1e-12));
        REQUIRE_THAT(est.cvar, WithinAbs(sigma * stats::normal_pdf(z) / 0.05, 1e-12));
        REQUIRE(est.mu == 0.0);

        ParametricEstimate with_drift = parametric_var_cvar(r, 0.95, ParametricDistribution::NORMAL,
                                                            Drift::INCLUDE, warnings);
        REQUIRE_THAT(with_drift.var, WithinAbs(est.var - stats::mean(r), 1e-12));
        REQUIRE(warnings.empty());
    }

    SECTION("Student-t converges to Normal on a large Normal sample")
    {
        std::vector<double> r = normal_sample(20000, 0.0, 0.01, 5);

        ParametricEstimate normal = parametric_var_cvar(r, 0.99, ParametricDistribution::NORMAL,
                                                        Drift::INCLUDE, warnings);
        ParametricEstimate student = parametric_var_cvar(r, 0.99, ParametricDistribution::STUDENT_T,
                                                         Drift::INCLUDE, warnings);

        REQUIRE(student.df.has_value());
        REQUIRE(*student.df > 10.0);
        REQUIRE_THAT(student.var, WithinRel(normal.var, 0.10));
        REQUIRE_THAT(student.cvar, WithinRel(normal.cvar, 0.10));
    }

    SECTION("Zero volatility gives zero VaR with a warning")
    {
        std::vector<double> flat(60, 0.0);
        ParametricEstimate est = parametric_var_cvar(flat, 0.95, ParametricDistribution::STUDENT_T,
                                                     Drift::IGNORE, warnings);
        REQUIRE(est.var == 0.0);
        REQUIRE(est.cvar == 0.0);
        REQUIRE(warnings.size() == 1);
    }

    SECTION("Heavy tails are flagged")
    {
        std::mt19937 gen(9);
        std::cauchy_distribution<double> cauchy(0.0, 0.01);
        std::vector<double> r(2000);
        for (auto &v : r)
        {
            v = cauchy(gen);
        }

        parametric_var_cvar(r, 0.95, ParametricDistribution::STUDENT_T, Drift::IGNORE, warnings);
        REQUIRE(std::find(warnings.begin(), warnings.end(),
                          "Student-t degrees of freedom <= 2; ES may be unstable.") != warnings.end());
    }

    SECTION("Needs two observations")
    {
        REQUIRE_THROWS_AS(parametric_var_cvar({0.01}, 0.95, ParametricDistribution::NORMAL,
                                              Drift::IGNORE, warnings),
                          InsufficientDataError);
    }
}

TEST_CASE_METHOD(TwoAssetFixture, "Component VaR", "[VaR][Component]")
{
    SECTION("Components add up to parametric-normal VaR")
    {
        for (int horizon : {1, 5})
        {
            auto components = component_var_normal(assets, weights, 0.99, horizon);
            REQUIRE(components.has_value());
            REQUIRE(components->size() == 2);

            double total = 0.0;
            for (const auto &c : *components)
            {
                total += c.component_var;
            }

            Eigen::MatrixXd x = assets.matrix();
            Eigen::VectorXd w(2);
            w << 0.6, 0.4;
            Eigen::VectorXd p = x * w;
            double sigma_p = std::sqrt((p.array() - p.mean()).square().sum() / (p.size() - 1.0) * horizon);
            double expected = -stats::inverse_normal_cdf(0.01) * sigma_p;
            REQUIRE_THAT(total, WithinRel(expected, 0.05));
        }
    }

    SECTION("Zero exposure gives no decomposition")
    {
        PortfolioWeights zero{{"AAA", 0.0}, {"BBB", 0.0}};
        REQUIRE_FALSE(component_var_normal(assets, zero, 0.99, 1).has_value());
    }
}

TEST_CASE_METHOD(TwoAssetFixture, "Monte Carlo VaR", "[VaR][MonteCarlo]")
{
    SECTION("Identical seed gives bit-identical results")
    {
        MonteCarloMethod mc{20000, 123};
        MonteCarloEstimate a = monte_carlo_var_cvar(assets, weights, 0.95, 1, mc, Drift::IGNORE);
        MonteCarloEstimate b = monte_carlo_var_cvar(assets, weights, 0.95, 1, mc, Drift::IGNORE);

        REQUIRE(a.var == b.var);
        REQUIRE(a.cvar == b.cvar);
        REQUIRE(a.simulated == b.simulated);

        VaRRequest request;
        request.method = mc;
        VaRResult ra = compute_var(portfolio, &assets, &weights, request);
        VaRResult rb = compute_var(portfolio, &assets, &weights, request);
        REQUIRE(ra.var == rb.var);
        REQUIRE(ra.histogram_simulated->counts == rb.histogram_simulated->counts);
        REQUIRE(ra.histogram_simulated->bin_edges == rb.histogram_simulated->bin_edges);
    }

    SECTION("Different seeds differ")
    {
        MonteCarloEstimate a = monte_carlo_var_cvar(assets, weights, 0.95, 1, {5000, 1}, Drift::IGNORE);
        MonteCarloEstimate b = monte_carlo_var_cvar(assets, weights, 0.95, 1, {5000, 2}, Drift::IGNORE);
        REQUIRE(a.simulated != b.simulated);
    }

    SECTION("Agrees with parametric-normal VaR")
    {
        MonteCarloEstimate est = monte_carlo_var_cvar(assets, weights, 0.99, 1, {100000, 42}, Drift::IGNORE);
        std::vector<std::string> warnings;
        ParametricEstimate param = parametric_var_cvar(portfolio.observed_values(), 0.99,
                                                       ParametricDistribution::NORMAL, Drift::IGNORE, warnings);
        REQUIRE_THAT(est.var, WithinRel(param.var, 0.05));
    }

    SECTION("Draws are capped")
    {
        MonteCarloEstimate est = monte_carlo_var_cvar(assets, weights, 0.95, 1, {MC_SIM_CAP + 1000, 42},
                                                      Drift::IGNORE);
        REQUIRE(est.simulations == MC_SIM_CAP);
        REQUIRE(est.simulated.size() == static_cast<size_t>(MC_SIM_CAP));
    }
}

TEST_CASE_METHOD(TwoAssetFixture, "compute_var", "[VaR][Engine]")
{
    SECTION("Historical result with rolling path and histogram")
    {
        VaRRequest request;
        request.portfolio_value = 1e6;
        request.rolling_window = 100;

        VaRResult result = compute_var(portfolio, nullptr, nullptr, request);
        REQUIRE(result.method == "historical");
        REQUIRE(result.metadata.effective_n == 500);
        REQUIRE(result.warnings.empty());
        REQUIRE(result.histogram.counts.size() == 50);
        REQUIRE_THAT(*result.var_amount, WithinAbs(result.var * 1e6, 1e-6));
        REQUIRE(result.rolling.has_value());
        REQUIRE(result.rolling->dates.size() == 400);
        REQUIRE(result.rolling->dates.front() == portfolio.date(99));
        REQUIRE_FALSE(result.contributions.has_value());
    }

    SECTION("Lookback keeps the most recent observations")
    {
        VaRRequest request;
        request.lookback = 40;
        VaRResult result = compute_var(portfolio, nullptr, nullptr, request);
        REQUIRE(result.metadata.effective_n == 40);
        REQUIRE(result.returns.back() == *portfolio.value(499));
        REQUIRE(result.warnings.front() == "Effective sample size < 50; results may be unstable.");
    }

    SECTION("Horizon aggregation")
    {
        VaRRequest request;
        request.horizon_days = 10;
        request.return_type = ReturnType::SIMPLE;
        VaRResult result = compute_var(portfolio, nullptr, nullptr, request);
        REQUIRE(result.metadata.effective_n == 491);
        REQUIRE(std::find(result.warnings.begin(), result.warnings.end(),
                          "Horizon scaling uses rolling aggregation and sqrt(h) approximations.") !=
                result.warnings.end());
    }

    SECTION("Parametric result carries component VaR")
    {
        VaRRequest request;
        request.method = ParametricMethod{};
        VaRResult result = compute_var(portfolio, &assets, &weights, request);
        REQUIRE(result.contributions.has_value());
        REQUIRE(result.metadata.sigma.has_value());
        REQUIRE_FALSE(result.metadata.df.has_value());
    }

    SECTION("Monte Carlo warnings and metadata")
    {
        VaRRequest request;
        request.method = MonteCarloMethod{1000, 42};
        VaRResult result = compute_var(portfolio, &assets, &weights, request);
        REQUIRE(result.metadata.horizon_model == "mvn_scaled");
        REQUIRE(*result.metadata.mc_sims == 1000);
        REQUIRE(result.warnings.back() == "Monte Carlo simulations are below 5,000; results may be noisy.");
        REQUIRE_FALSE(result.rolling.has_value());
        REQUIRE(result.histogram.counts == result.histogram_simulated->counts);
    }

    SECTION("Monte Carlo without asset returns")
    {
        VaRRequest request;
        request.method = MonteCarloMethod{};
        REQUIRE_THROWS_AS(compute_var(portfolio, nullptr, &weights, request), MissingInputError);
        REQUIRE_THROWS_AS(compute_var(portfolio, &assets, nullptr, request), MissingInputError);
    }

    SECTION("Invalid requests")
    {
        VaRRequest request;
        request.confidence = 1.2;
        REQUIRE_THROWS_AS(compute_var(portfolio, nullptr, nullptr, request), InvalidParameterError);

        request.confidence = 0.95;
        request.horizon_days = 0;
        REQUIRE_THROWS_AS(compute_var(portfolio, nullptr, nullptr, request), InvalidParameterError);

        REQUIRE_THROWS_AS(make_var_method("garch"), InvalidParameterError);
    }

    SECTION("Empty sample")
    {
        VaRRequest request;
        REQUIRE_THROWS_AS(compute_var(ReturnSeries(), nullptr, nullptr, request), InsufficientDataError);
    }

    SECTION("JSON export replaces non-finite values with null")
    {
        VaRRequest request;
        request.method = ParametricMethod{};
        std::vector<double> flat(60, 0.0);
        VaRResult result = compute_var(ReturnSeries::from_values(make_dates(60), flat), nullptr, nullptr, request);
        auto j = to_json(result);
        REQUIRE(j["var"] == 0.0);
        REQUIRE(j["warnings"].size() == 1);
        REQUIRE(j.contains("metadata"));
        REQUIRE(j["var_amount"].is_null());
    }
}
