#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "risk/sample_covariance.hpp"

#include <cmath>
#include <random>

using namespace riskcore;
using namespace riskcore::risk;
using Catch::Matchers::WithinAbs;

// Test fixture for shared return matrices
class SampleCovarianceFixture
{
protected:
    // 3 days, 2 assets; covariance worked by hand
    Eigen::MatrixXd returns_3x2_;

    // 250 days, 4 correlated assets
    Eigen::MatrixXd returns_250x4_;

    SampleCovarianceFixture()
    {
        returns_3x2_ = Eigen::MatrixXd(3, 2);
        returns_3x2_ << 0.01, 0.02,
            0.03, -0.01,
            -0.01, 0.02;

        std::mt19937 gen(42);
        std::normal_distribution<double> dist(0.0, 0.01);
        returns_250x4_ = Eigen::MatrixXd(250, 4);
        for (int i = 0; i < 250; ++i)
        {
            double market = dist(gen);
            for (int j = 0; j < 4; ++j)
            {
                returns_250x4_(i, j) = (0.5 + 0.2 * j) * market + dist(gen);
            }
        }
    }
};

TEST_CASE_METHOD(SampleCovarianceFixture, "SampleCovariance estimation", "[RiskModel][SampleCovariance]")
{
    SECTION("Construct with default parameters")
    {
        SampleCovariance cov;
        REQUIRE(cov.uses_bias_correction());
        REQUIRE(cov.get_name() == "sample");
    }

    SECTION("Hand-computed covariance")
    {
        // Means 0.01 and 0.01; deviations (0, 0.02, -0.02) and (0.01, -0.02, 0.01)
        SampleCovariance cov;
        auto result = cov.estimate_covariance(returns_3x2_);

        REQUIRE(result.rows() == 2);
        REQUIRE_THAT(result(0, 0), WithinAbs(0.0008 / 2.0, 1e-15));
        REQUIRE_THAT(result(1, 1), WithinAbs(0.0006 / 2.0, 1e-15));
        REQUIRE_THAT(result(0, 1), WithinAbs(-0.0006 / 2.0, 1e-15));
        REQUIRE(result(0, 1) == result(1, 0));
    }

    SECTION("Bias correction scales by n/(n-1)")
    {
        SampleCovariance unbiased(true);
        SampleCovariance biased(false);
        REQUIRE_FALSE(biased.uses_bias_correction());

        auto a = unbiased.estimate_covariance(returns_250x4_);
        auto b = biased.estimate_covariance(returns_250x4_);
        REQUIRE_THAT((a - b * 250.0 / 249.0).cwiseAbs().maxCoeff(), WithinAbs(0.0, 1e-15));
    }

    SECTION("Symmetric positive semi-definite")
    {
        SampleCovariance cov;
        auto result = cov.estimate_covariance(returns_250x4_);

        REQUIRE_THAT((result - result.transpose()).norm(), WithinAbs(0.0, 1e-15));
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(result);
        REQUIRE(solver.eigenvalues().minCoeff() >= -1e-12);
    }
}

TEST_CASE_METHOD(SampleCovarianceFixture, "SampleCovariance error handling", "[RiskModel][SampleCovariance]")
{
    SampleCovariance cov;

    SECTION("Empty returns matrix")
    {
        REQUIRE_THROWS_AS(cov.estimate_covariance(Eigen::MatrixXd(0, 0)), InvalidParameterError);
    }

    SECTION("Single observation")
    {
        Eigen::MatrixXd single_obs(1, 3);
        single_obs << 0.01, 0.02, 0.03;
        REQUIRE_THROWS_AS(cov.estimate_covariance(single_obs), InsufficientDataError);
    }

    SECTION("Non-finite values")
    {
        Eigen::MatrixXd bad = returns_3x2_;
        bad(1, 1) = std::nan("");
        REQUIRE_THROWS_AS(cov.estimate_covariance(bad), InvalidParameterError);
    }
}

TEST_CASE_METHOD(SampleCovarianceFixture, "Correlation estimation", "[RiskModel]")
{
    SampleCovariance cov;

    SECTION("Unit diagonal and bounded off-diagonal")
    {
        auto corr = cov.estimate_correlation(returns_250x4_);
        for (int i = 0; i < corr.rows(); ++i)
        {
            REQUIRE_THAT(corr(i, i), WithinAbs(1.0, 1e-12));
            for (int j = 0; j < corr.cols(); ++j)
            {
                REQUIRE(corr(i, j) >= -1.0);
                REQUIRE(corr(i, j) <= 1.0);
            }
        }
        // Shared market factor makes every pair positive
        REQUIRE(corr(0, 3) > 0.0);
    }

    SECTION("Zero-variance asset gives undefined correlation")
    {
        Eigen::MatrixXd covariance(2, 2);
        covariance << 0.04, 0.0,
            0.0, 0.0;
        auto corr = RiskModel::covariance_to_correlation(covariance);
        REQUIRE_THAT(corr(0, 0), WithinAbs(1.0, 1e-15));
        REQUIRE(std::isnan(corr(1, 1)));
        REQUIRE(std::isnan(corr(0, 1)));
    }

    SECTION("Non-square covariance")
    {
        REQUIRE_THROWS_AS(RiskModel::covariance_to_correlation(Eigen::MatrixXd(2, 3)), InvalidParameterError);
    }
}
