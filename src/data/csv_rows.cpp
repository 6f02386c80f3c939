/**
 * @file csv_rows.cpp
 * @brief Implementation of the lookup-table reader.
 */

#include "data/csv_rows.hpp"
#include "core/errors.hpp"
#include "core/text.hpp"

#include <fstream>
#include <sstream>

namespace perfattr
{
    namespace data
    {

        std::vector<std::vector<std::string>> read_csv_rows(const std::string &filepath, char delimiter)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw core::PerfAttrError(core::ErrorCode::DATA_SOURCE_UNAVAILABLE,
                                          "Could not open file: " + filepath);
            }

            std::vector<std::vector<std::string>> rows;
            std::string line;
            while (std::getline(file, line))
            {
                if (!line.empty() && line.back() == '\r')
                {
                    line.pop_back();
                }
                if (core::trim(line).empty())
                    continue;

                std::vector<std::string> fields;
                std::stringstream ss(line);
                std::string item;
                while (std::getline(ss, item, delimiter))
                {
                    fields.push_back(core::trim(item));
                }
                rows.push_back(std::move(fields));
            }

            return rows;
        }

        void require_two_columns(const std::vector<std::vector<std::string>> &rows,
                                 const std::string &what)
        {
            for (size_t i = 0; i < rows.size(); ++i)
            {
                if (rows[i].size() != 2)
                {
                    throw core::PerfAttrError(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID,
                                              what + " row " + std::to_string(i) + " has " +
                                                  std::to_string(rows[i].size()) + " columns, expected 2");
                }
            }
        }

    } // namespace data
} // namespace perfattr
