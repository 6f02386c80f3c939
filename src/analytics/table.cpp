/**
 * @file table.cpp
 * @brief Implementation of Table.
 */

#include "analytics/table.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace perfattr
{
    namespace analytics
    {

        namespace
        {

            bool cells_equal(const Cell &a, const Cell &b)
            {
                if (a.index() != b.index())
                {
                    return false;
                }
                if (const double *x = std::get_if<double>(&a))
                {
                    double y = std::get<double>(b);
                    return (std::isnan(*x) && std::isnan(y)) || *x == y;
                }
                return a == b;
            }

        } // anonymous namespace

        Table::Table(std::vector<Column> columns)
            : columns_(std::move(columns))
        {
            for (size_t i = 0; i < columns_.size(); ++i)
            {
                if (!index_.emplace(columns_[i], i).second)
                {
                    throw std::invalid_argument(std::string("Table: repeated column '") +
                                                column_name(columns_[i]) + "'");
                }
            }
        }

        void Table::add_row(std::vector<Cell> row)
        {
            if (row.size() != columns_.size())
            {
                throw std::invalid_argument("Table: row has " + std::to_string(row.size()) +
                                            " cells, expected " + std::to_string(columns_.size()));
            }
            rows_.push_back(std::move(row));
        }

        bool Table::has_column(Column column) const
        {
            return index_.find(column) != index_.end();
        }

        const std::vector<Cell> &Table::row(size_t index) const
        {
            if (index >= rows_.size())
            {
                throw std::out_of_range("Table: row " + std::to_string(index) + " out of range");
            }
            return rows_[index];
        }

        const Cell &Table::at(size_t row_index, Column column) const
        {
            return row(row_index)[column_index(column)];
        }

        double Table::number(size_t row_index, Column column) const
        {
            const Cell &cell = at(row_index, column);
            if (std::holds_alternative<std::monostate>(cell))
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            if (const double *value = std::get_if<double>(&cell))
            {
                return *value;
            }
            throw std::invalid_argument(std::string("Table: '") + column_name(column) + "' holds text");
        }

        std::string Table::text(size_t row_index, Column column) const
        {
            const Cell &cell = at(row_index, column);
            if (std::holds_alternative<std::monostate>(cell))
            {
                return std::string();
            }
            if (const std::string *value = std::get_if<std::string>(&cell))
            {
                return *value;
            }
            throw std::invalid_argument(std::string("Table: '") + column_name(column) + "' holds a number");
        }

        Eigen::VectorXd Table::numeric_column(Column column) const
        {
            Eigen::VectorXd values(static_cast<Eigen::Index>(rows_.size()));
            for (size_t r = 0; r < rows_.size(); ++r)
            {
                values(static_cast<Eigen::Index>(r)) = number(r, column);
            }
            return values;
        }

        bool Table::operator==(const Table &other) const
        {
            if (columns_ != other.columns_ || rows_.size() != other.rows_.size())
            {
                return false;
            }
            for (size_t r = 0; r < rows_.size(); ++r)
            {
                for (size_t c = 0; c < columns_.size(); ++c)
                {
                    if (!cells_equal(rows_[r][c], other.rows_[r][c]))
                    {
                        return false;
                    }
                }
            }
            return true;
        }

        size_t Table::column_index(Column column) const
        {
            auto it = index_.find(column);
            if (it == index_.end())
            {
                throw std::out_of_range(std::string("Table: no column '") + column_name(column) + "'");
            }
            return it->second;
        }

    } // namespace analytics
} // namespace perfattr
