/**
 * @file return_series.hpp
 * @brief Date-indexed return containers with explicit missing values.
 *
 * A missing observation is an absent value (std::nullopt at the accessor
 * level), never a silent zero and never a NaN flowing through arithmetic.
 * Every aggregation over these containers states its policy: drop the
 * missing rows (dropna, complete_rows), or keep them absent (align_to).
 *
 * Dates are ISO strings (YYYY-MM-DD); lexical order equals calendar order.
 */

#ifndef RISKCORE_DATA_RETURN_SERIES_HPP
#define RISKCORE_DATA_RETURN_SERIES_HPP

#include <Eigen/Dense>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riskcore
{
    /**
     *  @enum ReturnType
     *  @brief Type of return calculation.
     */
    enum class ReturnType
    {
        SIMPLE, /**< Simple returns (P_t / P_{t-1} - 1) */
        LOG     /**< Logarithmic returns (log(P_t / P_{t-1})) */
    };

    /**
     * @brief Parse "simple" or "log".
     * @throws InvalidParameterError for any other name.
     */
    ReturnType parse_return_type(const std::string &name);

    /** @brief "simple" or "log". */
    std::string to_string(ReturnType type);

    /**
     * @brief Signed weight per symbol. Symbols absent from the asset
     *        return matrix are zero exposure; assets without an entry
     *        contribute nothing.
     */
    using PortfolioWeights = std::map<std::string, double>;

    /**
     * @class ReturnSeries
     * @brief One ordered (date, optional value) sequence.
     *
     * Dates are strictly increasing and unique. Immutable after construction.
     */
    class ReturnSeries
    {
    public:
        ReturnSeries() = default;

        /**
         * @brief Construct from dates and optional values.
         * @throws InvalidParameterError if sizes differ or dates are not
         *         strictly increasing.
         */
        ReturnSeries(std::vector<std::string> dates,
                     std::vector<std::optional<double>> values);

        /**
         * @brief Construct a fully observed series.
         */
        static ReturnSeries from_values(const std::vector<std::string> &dates,
                                        const std::vector<double> &values);

        size_t size() const { return dates_.size(); }
        bool empty() const { return dates_.empty(); }

        const std::string &date(size_t i) const { return dates_.at(i); }
        const std::optional<double> &value(size_t i) const { return values_.at(i); }

        const std::vector<std::string> &dates() const { return dates_; }
        const std::vector<std::optional<double>> &values() const { return values_; }

        /** @brief Number of present observations. */
        size_t valid_count() const;

        /** @brief Number of absent observations. */
        size_t missing_count() const { return size() - valid_count(); }

        /** @brief Copy with every absent observation removed. */
        ReturnSeries dropna() const;

        /** @brief Last n entries (the whole series if n >= size). */
        ReturnSeries tail(size_t n) const;

        /** @brief Entries in [begin, end). */
        ReturnSeries slice(size_t begin, size_t end) const;

        /** @brief Present values in date order (absent entries skipped). */
        std::vector<double> observed_values() const;

        /**
         * @brief Index of a date.
         * @return Position, or -1 if the date is not in the series.
         */
        int find_date(const std::string &date) const;

    private:
        std::vector<std::string> dates_;
        std::vector<std::optional<double>> values_;
    };

    /**
     * @class AssetReturns
     * @brief Dates x symbols matrix of optional returns.
     *
     * Stored as an Eigen value matrix plus a presence mask. Cells whose mask
     * is false hold no meaningful value and are never read.
     */
    class AssetReturns
    {
    public:
        using Mask = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;

        AssetReturns() = default;

        /**
         * @brief Construct from values and presence mask.
         * @throws InvalidParameterError on dimension mismatch, duplicate
         *         symbols, or non-increasing dates.
         */
        AssetReturns(std::vector<std::string> dates,
                     std::vector<std::string> symbols,
                     Eigen::MatrixXd values,
                     Mask present);

        /**
         * @brief Construct from a matrix where NaN marks an absent cell.
         */
        static AssetReturns from_matrix(const std::vector<std::string> &dates,
                                        const std::vector<std::string> &symbols,
                                        const Eigen::MatrixXd &values);

        size_t num_dates() const { return dates_.size(); }
        size_t num_assets() const { return symbols_.size(); }
        bool empty() const { return dates_.empty() || symbols_.empty(); }

        const std::vector<std::string> &dates() const { return dates_; }
        const std::vector<std::string> &symbols() const { return symbols_; }

        std::optional<double> value(size_t row, size_t col) const;

        /** @brief True if every cell of the row is present. */
        bool row_complete(size_t row) const;

        /** @brief Column for one asset as a ReturnSeries. */
        ReturnSeries column(size_t col) const;

        /**
         * @brief Column by symbol.
         * @throws InvalidParameterError if the symbol is unknown.
         */
        ReturnSeries column(const std::string &symbol) const;

        /** @return Column index, or -1 if absent. */
        int find_symbol(const std::string &symbol) const;

        /** @brief Last n rows. */
        AssetReturns tail(size_t n) const;

        /**
         * @brief Rows for the requested dates in that order. Dates not
         *        present in this matrix become fully absent rows.
         */
        AssetReturns align_to(const std::vector<std::string> &dates) const;

        /** @brief Drop rows where no asset has an observation. */
        AssetReturns drop_empty_rows() const;

        /** @brief Drop rows with any absent cell. */
        AssetReturns complete_rows() const;

        /** @brief Copy without the named columns (unknown names are ignored). */
        AssetReturns drop_columns(const std::vector<std::string> &symbols) const;

        /** @brief Fraction of absent cells in a column (0 for an empty matrix). */
        double missing_fraction(size_t col) const;

        /**
         * @brief Dense matrix of the values.
         * @throws InsufficientDataError if any cell is absent; call
         *         complete_rows() first.
         */
        Eigen::MatrixXd matrix() const;

        /**
         * @brief Weight vector aligned to the columns (zero for unweighted assets).
         */
        Eigen::VectorXd weight_vector(const PortfolioWeights &weights) const;

    private:
        AssetReturns select_rows(const std::vector<size_t> &rows) const;

        std::vector<std::string> dates_;
        std::vector<std::string> symbols_;
        Eigen::MatrixXd values_;
        Mask present_;
    };

} // namespace riskcore

#endif // RISKCORE_DATA_RETURN_SERIES_HPP
