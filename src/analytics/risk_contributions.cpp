/**
 * @file risk_contributions.cpp
 * @brief Implementation of the risk contribution decomposition.
 */

#include "analytics/risk_contributions.hpp"
#include "core/errors.hpp"

#include <cmath>

namespace riskcore
{
    namespace analytics
    {

        std::vector<RiskContribution> risk_contributions(const Eigen::MatrixXd &covariance,
                                                         const std::vector<std::string> &symbols,
                                                         const Eigen::VectorXd &weights)
        {
            const Eigen::Index n = static_cast<Eigen::Index>(symbols.size());
            if (covariance.rows() != n || covariance.cols() != n || weights.size() != n)
            {
                throw InvalidParameterError(
                    "Covariance (" + std::to_string(covariance.rows()) + "x" + std::to_string(covariance.cols()) + ") and weights (" + std::to_string(weights.size()) + ") must match " + std::to_string(n) + " symbols");
            }

            std::vector<RiskContribution> rows(symbols.size());
            for (size_t i = 0; i < symbols.size(); ++i)
            {
                rows[i].symbol = symbols[i];
                rows[i].weight = weights(static_cast<Eigen::Index>(i));
            }
            if (n == 0)
            {
                return rows;
            }

            Eigen::VectorXd sigma_w = covariance * weights;
            double variance = weights.dot(sigma_w);
            if (!(variance > 0.0))
            {
                return rows;
            }

            const double sigma_p = std::sqrt(variance);
            for (size_t i = 0; i < symbols.size(); ++i)
            {
                const Eigen::Index idx = static_cast<Eigen::Index>(i);
                rows[i].mctr = sigma_w(idx) / sigma_p;
                rows[i].cctr = weights(idx) * rows[i].mctr;
                rows[i].pct_cctr = rows[i].cctr / sigma_p;
            }
            return rows;
        }

    } // namespace analytics
} // namespace riskcore
