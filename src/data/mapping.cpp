/**
 * @file mapping.cpp
 * @brief Implementation of Mapping.
 */

#include "data/mapping.hpp"
#include "data/csv_rows.hpp"
#include "core/errors.hpp"
#include "core/text.hpp"

#include <iostream>

namespace perfattr
{
    namespace data
    {

        Mapping::Mapping(const std::vector<std::string> &from_items,
                         const std::vector<std::vector<std::string>> &rows)
        {
            require_two_columns(rows, "Mapping");

            std::map<std::string, std::string> all_mappings;
            for (const auto &row : rows)
            {
                const std::string key = core::to_lower(core::trim(row[0]));
                auto inserted = all_mappings.emplace(key, core::trim(row[1]));
                if (!inserted.second && inserted.first->second != core::trim(row[1]))
                {
                    std::cerr << "Warning: mapping key '" << key << "' is repeated; keeping '"
                              << inserted.first->second << "'\n";
                }
            }

            keep_needed(from_items, all_mappings);
        }

        Mapping Mapping::from_map(const std::vector<std::string> &from_items,
                                  const std::map<std::string, std::string> &mappings)
        {
            std::vector<std::vector<std::string>> rows;
            rows.reserve(mappings.size());
            for (const auto &[from, to] : mappings)
            {
                rows.push_back({from, to});
            }
            return Mapping(from_items, rows);
        }

        Mapping Mapping::from_csv(const std::vector<std::string> &from_items,
                                  const std::string &filepath,
                                  char delimiter)
        {
            return Mapping(from_items, read_csv_rows(filepath, delimiter));
        }

        Mapping Mapping::from_json(const std::vector<std::string> &from_items, const nlohmann::json &j)
        {
            if (!j.contains("from") || !j.contains("to"))
            {
                throw core::PerfAttrError(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID,
                                          "Mapping JSON must contain 'from' and 'to' arrays");
            }

            std::vector<std::string> from;
            std::vector<std::string> to;
            try
            {
                from = j.at("from").get<std::vector<std::string>>();
                to = j.at("to").get<std::vector<std::string>>();
            }
            catch (const nlohmann::json::exception &e)
            {
                throw core::PerfAttrError(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID,
                                          "Mapping JSON: " + std::string(e.what()));
            }

            if (from.size() != to.size())
            {
                throw core::PerfAttrError(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID,
                                          "Mapping JSON: 'from' and 'to' size mismatch");
            }

            std::vector<std::vector<std::string>> rows;
            rows.reserve(from.size());
            for (size_t i = 0; i < from.size(); ++i)
            {
                rows.push_back({from[i], to[i]});
            }
            return Mapping(from_items, rows);
        }

        std::string Mapping::map(const std::string &from_item) const
        {
            const std::string key = core::to_lower(core::trim(from_item));
            auto it = mappings_.find(key);
            return (it == mappings_.end()) ? key : it->second;
        }

        std::vector<std::string> Mapping::map_all(const std::vector<std::string> &from_items) const
        {
            std::vector<std::string> mapped;
            mapped.reserve(from_items.size());
            for (const auto &item : from_items)
            {
                mapped.push_back(map(item));
            }
            return mapped;
        }

        void Mapping::keep_needed(const std::vector<std::string> &from_items,
                                  const std::map<std::string, std::string> &all_mappings)
        {
            mappings_.clear();
            for (const auto &item : from_items)
            {
                const std::string key = core::to_lower(core::trim(item));
                auto it = all_mappings.find(key);
                mappings_[key] = (it == all_mappings.end()) ? key : it->second;
            }
        }

    } // namespace data
} // namespace perfattr
