/**
 * @file csv_benchmark_provider.cpp
 * @brief Implementation of CsvBenchmarkProvider
 */

#include "data/csv_benchmark_provider.hpp"
#include "data/data_loader.hpp"
#include "returns/returns_engine.hpp"

#include <utility>

namespace riskcore
{

    CsvBenchmarkProvider::CsvBenchmarkProvider(PriceHistory prices)
        : prices_(std::move(prices))
    {
    }

    CsvBenchmarkProvider CsvBenchmarkProvider::from_file(const std::string &filepath)
    {
        return CsvBenchmarkProvider(DataLoader::load_csv(filepath));
    }

    std::optional<ReturnSeries> CsvBenchmarkProvider::fetch_returns(const std::string &symbol,
                                                                    const std::string &start_date,
                                                                    const std::string &end_date,
                                                                    ReturnType type) const
    {
        if (!prices_.has_ticker(symbol))
        {
            return std::nullopt;
        }

        // The price before start_date is kept so the first in-range date has a return
        PriceHistory window = prices_.filter_by_date("", end_date).select_assets({symbol});
        if (window.num_dates() < 2)
        {
            return std::nullopt;
        }

        ReturnSeries series = returns::compute_returns(window, type).column(0);
        size_t first = 0;
        while (first < series.size() && !start_date.empty() && series.date(first) < start_date)
        {
            ++first;
        }
        if (first >= series.size())
        {
            return std::nullopt;
        }
        return series.slice(first, series.size());
    }

} // namespace riskcore
