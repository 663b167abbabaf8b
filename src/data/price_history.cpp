/**
 * @file price_history.cpp
 * @brief Implementation of PriceHistory class
 */

#include "data/price_history.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace riskcore
{

    // ============================================================================
    // Constructors
    // ============================================================================

    PriceHistory::PriceHistory(const Eigen::MatrixXd &prices,
                               const std::vector<std::string> &dates,
                               const std::vector<std::string> &tickers)
        : prices_(prices), dates_(dates), tickers_(tickers)
    {
        if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw InvalidParameterError("Price matrix rows must match dates vector size");
        }
        if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw InvalidParameterError("Price matrix columns must match tickers vector size");
        }
        for (size_t i = 1; i < dates_.size(); ++i)
        {
            if (!(dates_[i - 1] < dates_[i]))
            {
                throw InvalidParameterError("Price dates must be strictly increasing near " + dates_[i]);
            }
        }

        build_index_maps();

        if (ticker_index_.size() != tickers_.size())
        {
            throw InvalidParameterError("Duplicate ticker in price history");
        }
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    std::optional<double> PriceHistory::price(size_t row, size_t col) const
    {
        double p = prices_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col));
        if (!std::isfinite(p))
        {
            return std::nullopt;
        }
        return p;
    }

    std::optional<double> PriceHistory::get_price(const std::string &ticker, const std::string &date) const
    {
        int ticker_idx = find_ticker_index(ticker);
        int date_idx = find_date_index(date);

        if (ticker_idx < 0)
        {
            throw InvalidParameterError("Ticker not found: " + ticker);
        }
        if (date_idx < 0)
        {
            throw InvalidParameterError("Date not found: " + date);
        }

        return price(static_cast<size_t>(date_idx), static_cast<size_t>(ticker_idx));
    }

    // ================================
    // Filtering
    // ================================

    PriceHistory PriceHistory::filter_by_date(const std::string &start_date,
                                              const std::string &end_date) const
    {
        if (!start_date.empty() && !end_date.empty() && end_date < start_date)
        {
            throw InvalidParameterError("Start date must be before end date");
        }

        auto first = start_date.empty()
                         ? dates_.begin()
                         : std::lower_bound(dates_.begin(), dates_.end(), start_date);
        auto last = end_date.empty()
                        ? dates_.end()
                        : std::upper_bound(dates_.begin(), dates_.end(), end_date);

        if (last < first)
        {
            last = first;
        }

        Eigen::Index start_idx = static_cast<Eigen::Index>(std::distance(dates_.begin(), first));
        Eigen::Index num_periods = static_cast<Eigen::Index>(std::distance(first, last));

        Eigen::MatrixXd filtered_prices = prices_.block(start_idx, 0, num_periods, prices_.cols());
        std::vector<std::string> filtered_dates(first, last);

        return PriceHistory(filtered_prices, filtered_dates, tickers_);
    }

    PriceHistory PriceHistory::select_assets(const std::vector<std::string> &selected_tickers) const
    {
        std::vector<int> indices;
        indices.reserve(selected_tickers.size());

        for (const auto &ticker : selected_tickers)
        {
            int idx = find_ticker_index(ticker);
            if (idx < 0)
            {
                throw InvalidParameterError("Ticker not found: " + ticker);
            }
            indices.push_back(idx);
        }

        Eigen::MatrixXd selected_prices(prices_.rows(), static_cast<Eigen::Index>(indices.size()));
        for (size_t i = 0; i < indices.size(); ++i)
        {
            selected_prices.col(static_cast<Eigen::Index>(i)) = prices_.col(indices[i]);
        }

        return PriceHistory(selected_prices, dates_, selected_tickers);
    }

    // ===================
    // Validation Methods
    // ===================

    size_t PriceHistory::count_missing() const
    {
        return static_cast<size_t>((!prices_.array().isFinite()).count());
    }

    void PriceHistory::print_summary() const
    {
        std::cout << "\n=== Price History Summary ===\n";
        std::cout << "Dimensions: " << prices_.rows() << " dates x "
                  << prices_.cols() << " assets\n";
        if (!dates_.empty())
        {
            std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
        }
        std::cout << "Assets: ";
        for (const auto &ticker : tickers_)
        {
            std::cout << ticker << " ";
        }
        std::cout << "\nMissing values: " << count_missing() << "\n";
        std::cout << "=============================\n"
                  << std::endl;
    }

    // =========================
    // Private Helper Methods
    // =========================

    int PriceHistory::find_ticker_index(const std::string &ticker) const
    {
        auto it = ticker_index_.find(ticker);
        if (it == ticker_index_.end())
        {
            return -1;
        }
        return static_cast<int>(it->second);
    }

    int PriceHistory::find_date_index(const std::string &date) const
    {
        auto it = date_index_.find(date);
        if (it == date_index_.end())
        {
            return -1;
        }
        return static_cast<int>(it->second);
    }

    void PriceHistory::build_index_maps()
    {
        date_index_.clear();
        ticker_index_.clear();

        for (size_t i = 0; i < dates_.size(); ++i)
        {
            date_index_[dates_[i]] = i;
        }

        for (size_t i = 0; i < tickers_.size(); ++i)
        {
            ticker_index_[tickers_[i]] = i;
        }
    }

} // namespace riskcore
