/**
 * @file risk_model.hpp
 * @brief Abstract interface for covariance estimation methods
 *
 * The VaR, component-VaR and risk-contribution computations take their
 * covariance from a RiskModel so the estimator can be swapped without
 * touching the engines.
 */

#ifndef RISKCORE_RISK_RISK_MODEL_HPP
#define RISKCORE_RISK_RISK_MODEL_HPP

#include <Eigen/Dense>
#include <string>

namespace riskcore
{
    namespace risk
    {

        /**
         * @class RiskModel
         * @brief Abstract base class for covariance estimation
         *
         * Usage Example:
         * @code
         * SampleCovariance model;
         * Eigen::MatrixXd cov = model.estimate_covariance(asset_returns.complete_rows().matrix());
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Estimate covariance matrix from return data
             * @param returns Matrix of returns (rows = observations, cols = assets)
             * @return Covariance matrix (n_assets x n_assets), exactly symmetric
             * @throws InvalidParameterError if returns is empty or not finite
             * @throws InsufficientDataError if fewer than 2 observations
             */
            virtual Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const = 0;

            /**
             * @brief Estimate correlation matrix from return data
             *
             * Default implementation converts the covariance estimate.
             */
            virtual Eigen::MatrixXd estimate_correlation(
                const Eigen::MatrixXd &returns) const;

            /**
             * @brief Short identifier reported in result metadata
             */
            virtual std::string get_name() const = 0;

            /**
             * @brief Convert covariance matrix to correlation matrix
             *
             * Rows and columns of assets with zero variance are NaN (undefined
             * correlation), including their diagonal entry. Other entries are
             * clamped to [-1, 1].
             *
             * @throws InvalidParameterError if covariance is not square
             */
            static Eigen::MatrixXd covariance_to_correlation(
                const Eigen::MatrixXd &covariance);

        protected:
            /**
             * @brief Validate input returns matrix
             */
            static void validate_returns(const Eigen::MatrixXd &returns);

            /**
             * @brief Symmetrise: (M + M^T) / 2
             */
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

    } // namespace risk
} // namespace riskcore

#endif // RISKCORE_RISK_RISK_MODEL_HPP
