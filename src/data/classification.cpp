/**
 * @file classification.cpp
 * @brief Implementation of Classification.
 */

#include "data/classification.hpp"
#include "data/csv_rows.hpp"
#include "data/performance.hpp"
#include "core/errors.hpp"
#include "core/text.hpp"

#include <iostream>

namespace perfattr
{
    namespace data
    {

        Classification::Classification(const std::string &name,
                                       const std::vector<std::vector<std::string>> &rows)
            : name_(core::trim(name))
        {
            require_two_columns(rows, "Classification '" + name_ + "'");

            for (const auto &row : rows)
            {
                const std::string id = core::to_lower(core::trim(row[0]));
                if (id.empty())
                {
                    throw core::PerfAttrError(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID,
                                              "Classification '" + name_ + "' has an empty identifier");
                }
                if (row[1].empty())
                {
                    std::cerr << "Warning: classification item '" << id << "' has no display name\n";
                }
                items_[id] = row[1];
            }
        }

        Classification Classification::from_map(const std::string &name,
                                                const std::map<std::string, std::string> &items)
        {
            std::vector<std::vector<std::string>> rows;
            rows.reserve(items.size());
            for (const auto &[id, item_name] : items)
            {
                rows.push_back({id, item_name});
            }
            return Classification(name, rows);
        }

        Classification Classification::from_csv(const std::string &name,
                                                const std::string &filepath,
                                                char delimiter)
        {
            return Classification(name, read_csv_rows(filepath, delimiter));
        }

        Classification Classification::from_json(const std::string &name, const nlohmann::json &j)
        {
            if (!j.contains("identifiers") || !j.contains("names"))
            {
                throw core::PerfAttrError(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID,
                                          "Classification JSON must contain 'identifiers' and 'names' arrays");
            }

            std::vector<std::string> identifiers;
            std::vector<std::string> names;
            try
            {
                identifiers = j.at("identifiers").get<std::vector<std::string>>();
                names = j.at("names").get<std::vector<std::string>>();
            }
            catch (const nlohmann::json::exception &e)
            {
                throw core::PerfAttrError(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID,
                                          "Classification JSON: " + std::string(e.what()));
            }

            if (identifiers.size() != names.size())
            {
                throw core::PerfAttrError(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID,
                                          "Classification JSON: 'identifiers' and 'names' size mismatch");
            }

            std::vector<std::vector<std::string>> rows;
            rows.reserve(identifiers.size());
            for (size_t i = 0; i < identifiers.size(); ++i)
            {
                rows.push_back({identifiers[i], names[i]});
            }
            return Classification(name, rows);
        }

        Classification Classification::infer(const Performance &portfolio, const Performance &benchmark)
        {
            const std::string &p_name = portfolio.classification_name();
            const std::string &b_name = benchmark.classification_name();

            if (!p_name.empty() && !b_name.empty() && p_name != b_name)
            {
                throw core::PerfAttrError(core::ErrorCode::MISSING_CLASSIFICATION_NAME,
                                          "Portfolio is classified by '" + p_name + "' and benchmark by '" +
                                              b_name + "'; name the classification to attribute by");
            }

            std::map<std::string, std::string> items = benchmark.classification_items();
            for (const auto &[id, item_name] : portfolio.classification_items())
            {
                items[id] = item_name;
            }

            return from_map(p_name.empty() ? b_name : p_name, items);
        }

        bool Classification::contains(const std::string &identifier) const
        {
            return items_.find(core::to_lower(identifier)) != items_.end();
        }

        std::string Classification::name_for(const std::string &identifier) const
        {
            auto it = items_.find(core::to_lower(identifier));
            return (it == items_.end()) ? std::string() : it->second;
        }

    } // namespace data
} // namespace perfattr
