/**
 * @file benchmark_provider.hpp
 * @brief Source of benchmark return series for the risk metrics engine.
 */

#ifndef RISKCORE_ANALYTICS_BENCHMARK_PROVIDER_HPP
#define RISKCORE_ANALYTICS_BENCHMARK_PROVIDER_HPP

#include "data/return_series.hpp"

#include <optional>
#include <string>

namespace riskcore
{
    namespace analytics
    {

        /**
         * @class BenchmarkProvider
         * @brief Abstract interface for fetching a benchmark's returns.
         *
         * Implementations convert prices for [start_date, end_date] into
         * returns of the requested type. std::nullopt signals a fetch failure
         * (unknown symbol, no data in range).
         */
        class BenchmarkProvider
        {
        public:
            virtual ~BenchmarkProvider() = default;

            virtual std::optional<ReturnSeries> fetch_returns(const std::string &symbol,
                                                              const std::string &start_date,
                                                              const std::string &end_date,
                                                              ReturnType type) const = 0;
        };

    } // namespace analytics
} // namespace riskcore

#endif // RISKCORE_ANALYTICS_BENCHMARK_PROVIDER_HPP
