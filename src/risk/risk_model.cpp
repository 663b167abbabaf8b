/**
 * @file risk_model.cpp
 * @brief Implementation of RiskModel base class utilities
 */

#include "risk/risk_model.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace riskcore
{
    namespace risk
    {
        Eigen::MatrixXd RiskModel::estimate_correlation(const Eigen::MatrixXd &returns) const
        {
            return covariance_to_correlation(estimate_covariance(returns));
        }

        void RiskModel::validate_returns(const Eigen::MatrixXd &returns)
        {
            if (returns.rows() == 0 || returns.cols() == 0)
            {
                throw InvalidParameterError("Returns matrix cannot be empty.");
            }

            if (returns.rows() < 2)
            {
                throw InsufficientDataError("Covariance estimation needs at least 2 observations. Received: " + std::to_string(returns.rows()));
            }

            if (!returns.allFinite())
            {
                throw InvalidParameterError("Returns matrix contains NaN or Inf values.");
            }
        }

        Eigen::MatrixXd RiskModel::covariance_to_correlation(const Eigen::MatrixXd &covariance)
        {
            const Eigen::Index n = covariance.rows();
            if (covariance.cols() != n)
            {
                throw InvalidParameterError("Covariance matrix must be square");
            }

            const double nan = std::numeric_limits<double>::quiet_NaN();
            Eigen::VectorXd std_devs = covariance.diagonal().cwiseMax(0.0).cwiseSqrt();
            Eigen::MatrixXd correlation(n, n);

            for (Eigen::Index i = 0; i < n; ++i)
            {
                for (Eigen::Index j = 0; j < n; ++j)
                {
                    if (!(std_devs(i) > 0.0) || !(std_devs(j) > 0.0))
                    {
                        correlation(i, j) = nan;
                    }
                    else if (i == j)
                    {
                        correlation(i, j) = 1.0;
                    }
                    else
                    {
                        double rho = covariance(i, j) / (std_devs(i) * std_devs(j));
                        correlation(i, j) = std::min(1.0, std::max(-1.0, rho));
                    }
                }
            }

            return correlation;
        }

        Eigen::MatrixXd RiskModel::ensure_symmetric(const Eigen::MatrixXd &matrix)
        {
            return 0.5 * (matrix + matrix.transpose());
        }
    } // namespace risk
} // namespace riskcore
