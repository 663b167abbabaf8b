/**
 * @file var_method.hpp
 * @brief VaR method selection and method-specific settings.
 *
 * The estimation method is a tagged variant; each alternative carries only
 * the settings that method reads. Names coming from configuration are
 * parsed into these types once, at the boundary.
 */

#ifndef RISKCORE_RISK_VAR_METHOD_HPP
#define RISKCORE_RISK_VAR_METHOD_HPP

#include <cstdint>
#include <string>
#include <variant>

namespace riskcore
{
    namespace risk
    {

        /** @brief Whether the fitted mean enters the loss quantile. */
        enum class Drift
        {
            IGNORE,
            INCLUDE
        };

        enum class ParametricDistribution
        {
            NORMAL,
            STUDENT_T
        };

        enum class HistoricalWeighting
        {
            NONE,
            EWMA
        };

        /** @brief Empirical quantile, optionally EWMA-weighted. */
        struct HistoricalMethod
        {
            HistoricalWeighting weighting = HistoricalWeighting::NONE;
            double lambda = 0.94; ///< EWMA decay, used only with EWMA weighting
        };

        /** @brief Closed-form quantile of a fitted distribution. */
        struct ParametricMethod
        {
            ParametricDistribution distribution = ParametricDistribution::NORMAL;
        };

        /** @brief Multivariate-normal simulation of the asset returns. */
        struct MonteCarloMethod
        {
            int simulations = 10000;
            std::uint64_t seed = 42;
        };

        using VaRMethod = std::variant<HistoricalMethod, ParametricMethod, MonteCarloMethod>;

        /** @brief Upper bound on Monte Carlo draws regardless of the request. */
        constexpr int MC_SIM_CAP = 200000;

        Drift parse_drift(const std::string &name);
        ParametricDistribution parse_distribution(const std::string &name);
        HistoricalWeighting parse_weighting(const std::string &name);

        std::string to_string(Drift drift);
        std::string to_string(ParametricDistribution distribution);
        std::string to_string(HistoricalWeighting weighting);

        /**
         * @brief "historical", "parametric" or "monte_carlo".
         */
        std::string method_name(const VaRMethod &method);

        /**
         * @brief Build a method from its configuration name and settings.
         *
         * Settings that do not belong to the named method are ignored.
         *
         * @throws InvalidParameterError for an unknown method name, a lambda
         *         outside (0, 1) with EWMA weighting, or fewer than 1 simulation.
         */
        VaRMethod make_var_method(const std::string &name,
                                  HistoricalWeighting weighting = HistoricalWeighting::NONE,
                                  double lambda = 0.94,
                                  ParametricDistribution distribution = ParametricDistribution::NORMAL,
                                  int simulations = 10000,
                                  std::uint64_t seed = 42);

    } // namespace risk
} // namespace riskcore

#endif // RISKCORE_RISK_VAR_METHOD_HPP
