/**
 * @file csv_rows.hpp
 * @brief Reading small delimited lookup tables.
 */

#ifndef PERFATTR_DATA_CSV_ROWS_HPP
#define PERFATTR_DATA_CSV_ROWS_HPP

#include <string>
#include <vector>

namespace perfattr
{
    namespace data
    {

        /**
         * @brief Read every non-blank line of a delimited file as a row of trimmed fields.
         * @param filepath Path to the file. There is no header line.
         * @param delimiter Field delimiter.
         * @return Rows in file order.
         * @throws PerfAttrError (DataSourceUnavailable) if the file cannot be opened.
         */
        std::vector<std::vector<std::string>> read_csv_rows(const std::string &filepath,
                                                            char delimiter = ',');

        /**
         * @brief Check that every row has exactly two columns.
         * @param rows Rows to check.
         * @param what "Classification" or "Mapping", for the message.
         * @throws PerfAttrError (ClassificationOrMappingColumnCountInvalid) otherwise.
         */
        void require_two_columns(const std::vector<std::vector<std::string>> &rows,
                                 const std::string &what);

    } // namespace data
} // namespace perfattr

#endif // PERFATTR_DATA_CSV_ROWS_HPP
