/**
 * @file errors.hpp
 * @brief Exception types raised by the risk engines.
 *
 * Parameter and data-sufficiency failures are reported as exceptions so the
 * boundary layer can map them to client errors. Numerically degenerate
 * situations (zero variance, unstable tail fits) are never thrown; they are
 * reported as warning strings alongside a best-effort result.
 */

#ifndef RISKCORE_CORE_ERRORS_HPP
#define RISKCORE_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace riskcore
{

    /**
     * @class InvalidParameterError
     * @brief Unknown method or distribution name, or a parameter outside its domain.
     */
    class InvalidParameterError : public std::invalid_argument
    {
    public:
        explicit InvalidParameterError(const std::string &message)
            : std::invalid_argument(message) {}
    };

    /**
     * @class InsufficientDataError
     * @brief Empty or too-short sample for the requested computation.
     */
    class InsufficientDataError : public std::runtime_error
    {
    public:
        explicit InsufficientDataError(const std::string &message)
            : std::runtime_error(message) {}
    };

    /**
     * @class MissingInputError
     * @brief A method needs an input the caller did not supply
     *        (e.g. Monte Carlo without per-asset returns or weights).
     */
    class MissingInputError : public std::invalid_argument
    {
    public:
        explicit MissingInputError(const std::string &message)
            : std::invalid_argument(message) {}
    };

    /**
     * @brief Throw InvalidParameterError unless confidence lies strictly in (0, 1).
     */
    inline void validate_confidence(double confidence)
    {
        if (!(confidence > 0.0 && confidence < 1.0))
        {
            throw InvalidParameterError(
                "Confidence level must be in (0, 1), got: " + std::to_string(confidence));
        }
    }

} // namespace riskcore

#endif // RISKCORE_CORE_ERRORS_HPP
