/**
 * @file risk_contributions.hpp
 * @brief Decomposition of portfolio volatility into per-asset contributions.
 *
 * With annualized covariance Sigma, weights w and sigma_p = sqrt(w' Sigma w):
 *
 *   marginal_i   = (Sigma w)_i / sigma_p
 *   component_i  = w_i * marginal_i
 *   percentage_i = component_i / sigma_p
 *
 * Components sum to sigma_p and percentages to 1.
 */

#ifndef RISKCORE_ANALYTICS_RISK_CONTRIBUTIONS_HPP
#define RISKCORE_ANALYTICS_RISK_CONTRIBUTIONS_HPP

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace riskcore
{
    namespace analytics
    {

        /**
         * @struct RiskContribution
         * @brief Contribution of one asset to portfolio volatility.
         */
        struct RiskContribution
        {
            std::string symbol;
            double weight = 0.0;
            double mctr = 0.0;     ///< Marginal contribution to risk
            double cctr = 0.0;     ///< Component contribution to risk
            double pct_cctr = 0.0; ///< Share of total risk
        };

        /**
         * @brief Per-asset contributions; all zero when w' Sigma w is not positive.
         * @param covariance Annualized covariance (symbols x symbols)
         * @param symbols Column names of the covariance
         * @param weights Weight per column
         * @throws InvalidParameterError on dimension mismatch
         */
        std::vector<RiskContribution> risk_contributions(const Eigen::MatrixXd &covariance,
                                                         const std::vector<std::string> &symbols,
                                                         const Eigen::VectorXd &weights);

    } // namespace analytics
} // namespace riskcore

#endif // RISKCORE_ANALYTICS_RISK_CONTRIBUTIONS_HPP
