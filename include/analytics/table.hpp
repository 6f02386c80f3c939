/**
 * @file table.hpp
 * @brief Generic tabular result handed to renderers and the auditor.
 */

#ifndef PERFATTR_ANALYTICS_TABLE_HPP
#define PERFATTR_ANALYTICS_TABLE_HPP

#include "analytics/columns.hpp"

#include <Eigen/Dense>

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace perfattr
{
    namespace analytics
    {

        /// Empty cell, number, or text.
        using Cell = std::variant<std::monostate, double, std::string>;

        /**
         * @class Table
         * @brief Ordered column headers and rows of cells.
         */
        class Table
        {
        public:
            Table() = default;

            /**
             * @brief Empty table with the given headers.
             * @throws std::invalid_argument if a column repeats.
             */
            explicit Table(std::vector<Column> columns);

            /**
             * @brief Append a row.
             * @throws std::invalid_argument if the row width differs from the header.
             */
            void add_row(std::vector<Cell> row);

            const std::vector<Column> &columns() const { return columns_; }
            bool has_column(Column column) const;

            size_t num_rows() const { return rows_.size(); }
            size_t num_columns() const { return columns_.size(); }
            bool empty() const { return rows_.empty(); }

            const std::vector<Cell> &row(size_t index) const;

            /**
             * @brief Cell at (row, column).
             * @throws std::out_of_range for an unknown column or row.
             */
            const Cell &at(size_t row, Column column) const;

            /**
             * @brief Numeric value at (row, column).
             * @return The number, or NaN for an empty cell.
             * @throws std::invalid_argument if the cell holds text.
             */
            double number(size_t row, Column column) const;

            /**
             * @brief Text value at (row, column).
             * @return The text, or an empty string for an empty cell.
             * @throws std::invalid_argument if the cell holds a number.
             */
            std::string text(size_t row, Column column) const;

            /**
             * @brief Whole column as numbers; empty cells become NaN.
             * @throws std::invalid_argument if the column holds text.
             */
            Eigen::VectorXd numeric_column(Column column) const;

            /** @brief Same headers and cells; NaN cells compare equal to NaN. */
            bool operator==(const Table &other) const;
            bool operator!=(const Table &other) const { return !(*this == other); }

        private:
            size_t column_index(Column column) const;

            std::vector<Column> columns_;
            std::map<Column, size_t> index_;
            std::vector<std::vector<Cell>> rows_;
        };

    } // namespace analytics
} // namespace perfattr

#endif // PERFATTR_ANALYTICS_TABLE_HPP
