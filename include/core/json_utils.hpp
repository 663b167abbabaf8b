/**
 * @file json_utils.hpp
 * @brief Helpers for exporting numeric results to JSON.
 *
 * Non-finite doubles (NaN, +/-Infinity) and absent optionals are written
 * as JSON null, never coerced to zero.
 */

#ifndef RISKCORE_CORE_JSON_UTILS_HPP
#define RISKCORE_CORE_JSON_UTILS_HPP

#include <nlohmann/json.hpp>

#include <cmath>
#include <optional>
#include <vector>

namespace riskcore
{
    namespace json_utils
    {

        inline nlohmann::json number(double value)
        {
            if (!std::isfinite(value))
            {
                return nullptr;
            }
            return value;
        }

        inline nlohmann::json number(const std::optional<double> &value)
        {
            if (!value.has_value())
            {
                return nullptr;
            }
            return number(*value);
        }

        inline nlohmann::json array(const std::vector<double> &values)
        {
            nlohmann::json out = nlohmann::json::array();
            for (double v : values)
            {
                out.push_back(number(v));
            }
            return out;
        }

        inline nlohmann::json array(const std::vector<std::optional<double>> &values)
        {
            nlohmann::json out = nlohmann::json::array();
            for (const auto &v : values)
            {
                out.push_back(number(v));
            }
            return out;
        }

    } // namespace json_utils
} // namespace riskcore

#endif // RISKCORE_CORE_JSON_UTILS_HPP
