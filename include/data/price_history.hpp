/*
 * @file price_history.hpp
 * @brief Multi-asset price table with explicit missing cells.
 *
 * Prices are stored in an Eigen matrix (dates x assets). A cell that was not
 * observed is stored as NaN and surfaced as std::nullopt by the accessors;
 * the NaN never leaves this class.
 */

#ifndef RISKCORE_DATA_PRICE_HISTORY_HPP
#define RISKCORE_DATA_PRICE_HISTORY_HPP

#include <Eigen/Dense>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riskcore
{

    /**
     * @class PriceHistory
     * @brief Container for date-indexed prices of several assets.
     *
     * Dates are ISO strings, strictly increasing and unique. Tickers are unique.
     */
    class PriceHistory
    {
    public:
        PriceHistory() = default;

        /**
         * @brief Constructor with data.
         * @param prices Price matrix (dates x assets); NaN marks a missing cell.
         * @param dates Vector of date strings.
         * @param tickers Vector of asset ticker symbols.
         * @throws InvalidParameterError on dimension mismatch, duplicate
         *         tickers or dates that are not strictly increasing.
         */
        PriceHistory(const Eigen::MatrixXd &prices,
                     const std::vector<std::string> &dates,
                     const std::vector<std::string> &tickers);

        ~PriceHistory() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        const std::vector<std::string> &get_dates() const
        {
            return dates_;
        }

        const std::vector<std::string> &get_tickers() const
        {
            return tickers_;
        }

        size_t num_dates() const
        {
            return static_cast<size_t>(prices_.rows());
        }

        size_t num_assets() const
        {
            return static_cast<size_t>(prices_.cols());
        }

        bool empty() const
        {
            return prices_.rows() == 0 || prices_.cols() == 0;
        }

        /**
         * @brief Price at a cell, or nullopt if it was not observed.
         */
        std::optional<double> price(size_t row, size_t col) const;

        /**
         * @brief Price for a ticker and date.
         * @throws InvalidParameterError if either is unknown.
         */
        std::optional<double> get_price(const std::string &ticker, const std::string &date) const;

        /**
         * @brief Whether the ticker is present.
         */
        bool has_ticker(const std::string &ticker) const
        {
            return ticker_index_.count(ticker) > 0;
        }

        /** ===========================================
         *  Filtering Methods
         *  ===========================================
         */

        /**
         * @brief Rows whose date lies in [start_date, end_date].
         *
         * Either bound may be empty (unbounded). Bounds need not be dates
         * present in the table.
         */
        PriceHistory filter_by_date(const std::string &start_date,
                                    const std::string &end_date) const;

        /**
         * @brief Select subset of assets
         * @param selected_tickers Tickers to keep, in the requested order
         * @throws InvalidParameterError if a ticker is unknown
         */
        PriceHistory select_assets(const std::vector<std::string> &selected_tickers) const;

        /** ===========================================
         *  Validation Methods
         *  ===========================================
         */

        /**
         * @brief Count missing cells
         */
        size_t count_missing() const;

        /**
         * @brief Print summary statistics to std::cout
         */
        void print_summary() const;

    private:
        int find_ticker_index(const std::string &ticker) const;
        int find_date_index(const std::string &date) const;
        void build_index_maps();

        Eigen::MatrixXd prices_;                     ///< Price matrix (dates x assets)
        std::vector<std::string> dates_;             ///< Date strings
        std::vector<std::string> tickers_;           ///< Asset tickers
        std::map<std::string, size_t> date_index_;   ///< Date to index map
        std::map<std::string, size_t> ticker_index_; ///< Ticker to index map
    };

} // namespace riskcore

#endif // RISKCORE_DATA_PRICE_HISTORY_HPP
