/**
 * @file return_series.cpp
 * @brief Implementation of ReturnSeries and AssetReturns
 */

#include "data/return_series.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace riskcore
{

    namespace
    {
        void validate_dates(const std::vector<std::string> &dates)
        {
            for (size_t i = 1; i < dates.size(); ++i)
            {
                if (!(dates[i - 1] < dates[i]))
                {
                    throw InvalidParameterError(
                        "Dates must be strictly increasing: '" + dates[i - 1] + "' followed by '" + dates[i] + "'");
                }
            }
        }
    } // anonymous namespace

    ReturnType parse_return_type(const std::string &name)
    {
        if (name == "simple")
        {
            return ReturnType::SIMPLE;
        }
        if (name == "log")
        {
            return ReturnType::LOG;
        }
        throw InvalidParameterError("Unknown return type: " + name);
    }

    std::string to_string(ReturnType type)
    {
        return type == ReturnType::LOG ? "log" : "simple";
    }

    // ============================================================================
    // ReturnSeries
    // ============================================================================

    ReturnSeries::ReturnSeries(std::vector<std::string> dates,
                               std::vector<std::optional<double>> values)
        : dates_(std::move(dates)), values_(std::move(values))
    {
        if (dates_.size() != values_.size())
        {
            throw InvalidParameterError(
                "Dates size (" + std::to_string(dates_.size()) + ") must match values size (" + std::to_string(values_.size()) + ")");
        }
        validate_dates(dates_);
    }

    ReturnSeries ReturnSeries::from_values(const std::vector<std::string> &dates,
                                           const std::vector<double> &values)
    {
        std::vector<std::optional<double>> wrapped(values.begin(), values.end());
        return ReturnSeries(dates, std::move(wrapped));
    }

    size_t ReturnSeries::valid_count() const
    {
        return static_cast<size_t>(std::count_if(values_.begin(), values_.end(),
                                                 [](const std::optional<double> &v)
                                                 { return v.has_value(); }));
    }

    ReturnSeries ReturnSeries::dropna() const
    {
        std::vector<std::string> dates;
        std::vector<std::optional<double>> values;
        dates.reserve(values_.size());
        values.reserve(values_.size());

        for (size_t i = 0; i < values_.size(); ++i)
        {
            if (values_[i].has_value())
            {
                dates.push_back(dates_[i]);
                values.push_back(values_[i]);
            }
        }
        return ReturnSeries(std::move(dates), std::move(values));
    }

    ReturnSeries ReturnSeries::tail(size_t n) const
    {
        if (n >= size())
        {
            return *this;
        }
        return slice(size() - n, size());
    }

    ReturnSeries ReturnSeries::slice(size_t begin, size_t end) const
    {
        end = std::min(end, size());
        begin = std::min(begin, end);
        return ReturnSeries(
            std::vector<std::string>(dates_.begin() + begin, dates_.begin() + end),
            std::vector<std::optional<double>>(values_.begin() + begin, values_.begin() + end));
    }

    std::vector<double> ReturnSeries::observed_values() const
    {
        std::vector<double> out;
        out.reserve(values_.size());
        for (const auto &v : values_)
        {
            if (v.has_value())
            {
                out.push_back(*v);
            }
        }
        return out;
    }

    int ReturnSeries::find_date(const std::string &date) const
    {
        auto it = std::lower_bound(dates_.begin(), dates_.end(), date);
        if (it == dates_.end() || *it != date)
        {
            return -1;
        }
        return static_cast<int>(std::distance(dates_.begin(), it));
    }

    // ============================================================================
    // AssetReturns
    // ============================================================================

    AssetReturns::AssetReturns(std::vector<std::string> dates,
                               std::vector<std::string> symbols,
                               Eigen::MatrixXd values,
                               Mask present)
        : dates_(std::move(dates)), symbols_(std::move(symbols)), values_(std::move(values)), present_(std::move(present))
    {
        if (values_.rows() != static_cast<Eigen::Index>(dates_.size()) ||
            values_.cols() != static_cast<Eigen::Index>(symbols_.size()))
        {
            throw InvalidParameterError("Return matrix dimensions must match dates x symbols");
        }
        if (present_.rows() != values_.rows() || present_.cols() != values_.cols())
        {
            throw InvalidParameterError("Presence mask dimensions must match the return matrix");
        }
        std::set<std::string> unique(symbols_.begin(), symbols_.end());
        if (unique.size() != symbols_.size())
        {
            throw InvalidParameterError("Asset symbols must be unique");
        }
        validate_dates(dates_);
    }

    AssetReturns AssetReturns::from_matrix(const std::vector<std::string> &dates,
                                           const std::vector<std::string> &symbols,
                                           const Eigen::MatrixXd &values)
    {
        Mask present = values.array().isFinite();
        Eigen::MatrixXd cleaned = present.select(values, 0.0);
        return AssetReturns(dates, symbols, cleaned, present);
    }

    std::optional<double> AssetReturns::value(size_t row, size_t col) const
    {
        if (!present_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col)))
        {
            return std::nullopt;
        }
        return values_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col));
    }

    bool AssetReturns::row_complete(size_t row) const
    {
        return present_.row(static_cast<Eigen::Index>(row)).all();
    }

    ReturnSeries AssetReturns::column(size_t col) const
    {
        if (col >= symbols_.size())
        {
            throw InvalidParameterError("Column index out of range: " + std::to_string(col));
        }
        std::vector<std::optional<double>> values;
        values.reserve(dates_.size());
        for (size_t i = 0; i < dates_.size(); ++i)
        {
            values.push_back(value(i, col));
        }
        return ReturnSeries(dates_, std::move(values));
    }

    ReturnSeries AssetReturns::column(const std::string &symbol) const
    {
        int idx = find_symbol(symbol);
        if (idx < 0)
        {
            throw InvalidParameterError("Symbol not found: " + symbol);
        }
        return column(static_cast<size_t>(idx));
    }

    int AssetReturns::find_symbol(const std::string &symbol) const
    {
        auto it = std::find(symbols_.begin(), symbols_.end(), symbol);
        if (it == symbols_.end())
        {
            return -1;
        }
        return static_cast<int>(std::distance(symbols_.begin(), it));
    }

    AssetReturns AssetReturns::tail(size_t n) const
    {
        if (n >= num_dates())
        {
            return *this;
        }
        std::vector<size_t> rows;
        for (size_t i = num_dates() - n; i < num_dates(); ++i)
        {
            rows.push_back(i);
        }
        return select_rows(rows);
    }

    AssetReturns AssetReturns::align_to(const std::vector<std::string> &dates) const
    {
        const Eigen::Index n = static_cast<Eigen::Index>(dates.size());
        const Eigen::Index k = static_cast<Eigen::Index>(symbols_.size());

        Eigen::MatrixXd values = Eigen::MatrixXd::Zero(n, k);
        Mask present = Mask::Constant(n, k, false);

        for (Eigen::Index i = 0; i < n; ++i)
        {
            auto it = std::lower_bound(dates_.begin(), dates_.end(), dates[static_cast<size_t>(i)]);
            if (it == dates_.end() || *it != dates[static_cast<size_t>(i)])
            {
                continue;
            }
            Eigen::Index src = static_cast<Eigen::Index>(std::distance(dates_.begin(), it));
            values.row(i) = values_.row(src);
            present.row(i) = present_.row(src);
        }

        return AssetReturns(dates, symbols_, values, present);
    }

    AssetReturns AssetReturns::drop_empty_rows() const
    {
        std::vector<size_t> rows;
        for (size_t i = 0; i < num_dates(); ++i)
        {
            if (present_.row(static_cast<Eigen::Index>(i)).any())
            {
                rows.push_back(i);
            }
        }
        return select_rows(rows);
    }

    AssetReturns AssetReturns::complete_rows() const
    {
        std::vector<size_t> rows;
        for (size_t i = 0; i < num_dates(); ++i)
        {
            if (row_complete(i))
            {
                rows.push_back(i);
            }
        }
        return select_rows(rows);
    }

    AssetReturns AssetReturns::drop_columns(const std::vector<std::string> &symbols) const
    {
        std::vector<Eigen::Index> keep;
        std::vector<std::string> kept_symbols;
        for (size_t j = 0; j < symbols_.size(); ++j)
        {
            if (std::find(symbols.begin(), symbols.end(), symbols_[j]) == symbols.end())
            {
                keep.push_back(static_cast<Eigen::Index>(j));
                kept_symbols.push_back(symbols_[j]);
            }
        }

        const Eigen::Index n = values_.rows();
        const Eigen::Index k = static_cast<Eigen::Index>(keep.size());
        Eigen::MatrixXd values(n, k);
        Mask present(n, k);
        for (Eigen::Index j = 0; j < k; ++j)
        {
            values.col(j) = values_.col(keep[static_cast<size_t>(j)]);
            present.col(j) = present_.col(keep[static_cast<size_t>(j)]);
        }
        return AssetReturns(dates_, kept_symbols, values, present);
    }

    double AssetReturns::missing_fraction(size_t col) const
    {
        if (num_dates() == 0)
        {
            return 0.0;
        }
        Eigen::Index present_count = present_.col(static_cast<Eigen::Index>(col)).count();
        return 1.0 - static_cast<double>(present_count) / static_cast<double>(num_dates());
    }

    Eigen::MatrixXd AssetReturns::matrix() const
    {
        if (!present_.all())
        {
            throw InsufficientDataError("Asset return matrix has missing observations; drop incomplete rows first");
        }
        return values_;
    }

    Eigen::VectorXd AssetReturns::weight_vector(const PortfolioWeights &weights) const
    {
        Eigen::VectorXd w = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(symbols_.size()));
        for (size_t j = 0; j < symbols_.size(); ++j)
        {
            auto it = weights.find(symbols_[j]);
            if (it != weights.end())
            {
                w(static_cast<Eigen::Index>(j)) = it->second;
            }
        }
        return w;
    }

    AssetReturns AssetReturns::select_rows(const std::vector<size_t> &rows) const
    {
        const Eigen::Index n = static_cast<Eigen::Index>(rows.size());
        const Eigen::Index k = values_.cols();

        std::vector<std::string> dates;
        dates.reserve(rows.size());
        Eigen::MatrixXd values(n, k);
        Mask present(n, k);

        for (Eigen::Index i = 0; i < n; ++i)
        {
            Eigen::Index src = static_cast<Eigen::Index>(rows[static_cast<size_t>(i)]);
            dates.push_back(dates_[rows[static_cast<size_t>(i)]]);
            values.row(i) = values_.row(src);
            present.row(i) = present_.row(src);
        }
        return AssetReturns(std::move(dates), symbols_, values, present);
    }

} // namespace riskcore
