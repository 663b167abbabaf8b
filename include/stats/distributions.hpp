/**
 * @file distributions.hpp
 * @brief Normal, Student-t and chi-squared distribution functions.
 *
 * Closed-form or series/continued-fraction evaluations; no external
 * special-function library is required. Accuracy is well below the
 * sampling noise of any risk estimate built on top.
 */

#ifndef RISKCORE_STATS_DISTRIBUTIONS_HPP
#define RISKCORE_STATS_DISTRIBUTIONS_HPP

#include <vector>

namespace riskcore
{
    namespace stats
    {

        /**
         * @struct StudentTFit
         * @brief Location/scale Student-t parameters.
         */
        struct StudentTFit
        {
            double df;
            double loc;
            double scale;
        };

        /** @brief Standard normal density. */
        double normal_pdf(double x);

        /** @brief Standard normal CDF. */
        double normal_cdf(double x);

        /**
         * @brief Inverse of the standard normal CDF (probit).
         * @throws InvalidParameterError if p is not in (0, 1)
         */
        double inverse_normal_cdf(double p);

        /** @brief Standard Student-t density with df degrees of freedom. */
        double student_t_pdf(double x, double df);

        /** @brief Standard Student-t CDF. */
        double student_t_cdf(double x, double df);

        /**
         * @brief Inverse of the standard Student-t CDF.
         * @throws InvalidParameterError if p is not in (0, 1) or df <= 0
         */
        double student_t_quantile(double p, double df);

        /**
         * @brief Chi-squared CDF with k degrees of freedom.
         * @return 0 for x <= 0
         */
        double chi_squared_cdf(double x, double k);

        /**
         * @brief Regularized incomplete beta function I_x(a, b).
         */
        double regularized_incomplete_beta(double a, double b, double x);

        /**
         * @brief Regularized lower incomplete gamma function P(a, x).
         */
        double regularized_lower_gamma(double a, double x);

        /**
         * @brief Maximum-likelihood location/scale Student-t fit.
         *
         * For fixed df the location and scale are found by the EM
         * (iteratively reweighted) scheme; df is chosen by maximising the
         * profile log-likelihood over [0.5, 1000] on a log grid refined by
         * golden-section search.
         *
         * @throws InsufficientDataError if fewer than 2 values
         */
        StudentTFit fit_student_t(const std::vector<double> &values);

        /**
         * @brief Student-t log-likelihood of a sample.
         */
        double student_t_log_likelihood(const std::vector<double> &values,
                                        double df, double loc, double scale);

    } // namespace stats
} // namespace riskcore

#endif // RISKCORE_STATS_DISTRIBUTIONS_HPP
