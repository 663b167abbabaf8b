/**
 * @file var_method.cpp
 * @brief Name parsing for VaR method settings.
 */

#include "risk/var_method.hpp"
#include "core/errors.hpp"

namespace riskcore
{
    namespace risk
    {

        Drift parse_drift(const std::string &name)
        {
            if (name == "ignore")
            {
                return Drift::IGNORE;
            }
            if (name == "include")
            {
                return Drift::INCLUDE;
            }
            throw InvalidParameterError("Unknown drift setting: " + name);
        }

        ParametricDistribution parse_distribution(const std::string &name)
        {
            if (name == "normal")
            {
                return ParametricDistribution::NORMAL;
            }
            if (name == "student_t")
            {
                return ParametricDistribution::STUDENT_T;
            }
            throw InvalidParameterError("Unknown parametric distribution: " + name);
        }

        HistoricalWeighting parse_weighting(const std::string &name)
        {
            if (name == "none")
            {
                return HistoricalWeighting::NONE;
            }
            if (name == "ewma")
            {
                return HistoricalWeighting::EWMA;
            }
            throw InvalidParameterError("Unknown historical weighting: " + name);
        }

        std::string to_string(Drift drift)
        {
            return drift == Drift::INCLUDE ? "include" : "ignore";
        }

        std::string to_string(ParametricDistribution distribution)
        {
            return distribution == ParametricDistribution::STUDENT_T ? "student_t" : "normal";
        }

        std::string to_string(HistoricalWeighting weighting)
        {
            return weighting == HistoricalWeighting::EWMA ? "ewma" : "none";
        }

        std::string method_name(const VaRMethod &method)
        {
            switch (method.index())
            {
            case 0:
                return "historical";
            case 1:
                return "parametric";
            default:
                return "monte_carlo";
            }
        }

        VaRMethod make_var_method(const std::string &name,
                                  HistoricalWeighting weighting,
                                  double lambda,
                                  ParametricDistribution distribution,
                                  int simulations,
                                  std::uint64_t seed)
        {
            if (name == "historical")
            {
                if (weighting == HistoricalWeighting::EWMA && !(lambda > 0.0 && lambda < 1.0))
                {
                    throw InvalidParameterError(
                        "EWMA lambda must be in (0, 1), got: " + std::to_string(lambda));
                }
                return HistoricalMethod{weighting, lambda};
            }
            if (name == "parametric")
            {
                return ParametricMethod{distribution};
            }
            if (name == "monte_carlo")
            {
                if (simulations < 1)
                {
                    throw InvalidParameterError(
                        "Expected positive value for parameter 'mc_sims', got: " + std::to_string(simulations));
                }
                return MonteCarloMethod{simulations, seed};
            }
            throw InvalidParameterError("Unknown VaR method: " + name);
        }

    } // namespace risk
} // namespace riskcore
