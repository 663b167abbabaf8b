/**
 * @file sample_covariance.hpp
 * @brief Classical sample covariance estimator
 *
 * Formula (with bias correction):
 *     Cov = (1/(n-1)) * (X - mean(X))^T * (X - mean(X))
 */

#ifndef RISKCORE_RISK_SAMPLE_COVARIANCE_HPP
#define RISKCORE_RISK_SAMPLE_COVARIANCE_HPP

#include "risk_model.hpp"

namespace riskcore
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Sample covariance matrix estimator
         *
         * Positive semi-definite by construction. Used for the Monte Carlo
         * model, the component VaR decomposition and risk contributions.
         */
        class SampleCovariance : public RiskModel
        {
        public:
            /**
             * @param bias_correction Divide by n-1 (default) instead of n
             */
            explicit SampleCovariance(bool bias_correction = true);

            ~SampleCovariance() override = default;

            Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const override;

            /**
             * @return "sample"
             */
            std::string get_name() const override;

            bool uses_bias_correction() const { return bias_correction_; }

        private:
            bool bias_correction_;
        };

    } // namespace risk
} // namespace riskcore

#endif // RISKCORE_RISK_SAMPLE_COVARIANCE_HPP
