/**
 * @file csv_benchmark_provider.hpp
 * @brief Benchmark returns served from a loaded price history.
 */

#ifndef RISKCORE_DATA_CSV_BENCHMARK_PROVIDER_HPP
#define RISKCORE_DATA_CSV_BENCHMARK_PROVIDER_HPP

#include "analytics/benchmark_provider.hpp"
#include "data/price_history.hpp"

#include <string>

namespace riskcore
{

    /**
     * @class CsvBenchmarkProvider
     * @brief BenchmarkProvider over prices read with DataLoader::load_csv().
     *
     * The benchmark may live in the portfolio's own price file or in a
     * separate one.
     */
    class CsvBenchmarkProvider : public analytics::BenchmarkProvider
    {
    public:
        explicit CsvBenchmarkProvider(PriceHistory prices);

        /**
         * @brief Load prices from a CSV file.
         * @throws std::runtime_error if the file cannot be loaded
         */
        static CsvBenchmarkProvider from_file(const std::string &filepath);

        std::optional<ReturnSeries> fetch_returns(const std::string &symbol,
                                                  const std::string &start_date,
                                                  const std::string &end_date,
                                                  ReturnType type) const override;

    private:
        PriceHistory prices_;
    };

} // namespace riskcore

#endif // RISKCORE_DATA_CSV_BENCHMARK_PROVIDER_HPP
