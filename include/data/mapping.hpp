/**
 * @file mapping.hpp
 * @brief One-directional relabeling of identifiers between classifications.
 *
 * Sample rows mapping "Security" to "Gics Sub-Industry":
 *
 *   AAPL, 45202030
 *   MSFT, 45103020
 */

#ifndef PERFATTR_DATA_MAPPING_HPP
#define PERFATTR_DATA_MAPPING_HPP

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace perfattr
{
    namespace data
    {

        /**
         * @class Mapping
         * @brief Needed subset of an identifier -> identifier dictionary.
         *
         * Only the items to map are kept. An item the source does not map is
         * mapped to itself. Keys are lower-cased before matching.
         */
        class Mapping
        {
        public:
            Mapping() = default;

            /**
             * @brief Construct from two-column rows (from item, to item).
             * @param from_items Items that will be mapped.
             * @param rows Tabular rows; each must have exactly 2 columns.
             * @throws PerfAttrError (ClassificationOrMappingColumnCountInvalid) otherwise.
             */
            Mapping(const std::vector<std::string> &from_items,
                    const std::vector<std::vector<std::string>> &rows);

            static Mapping from_map(const std::vector<std::string> &from_items,
                                    const std::map<std::string, std::string> &mappings);

            /**
             * @brief Load a headerless two-column CSV file.
             * @throws PerfAttrError (DataSourceUnavailable) if the file cannot be opened.
             * @throws PerfAttrError (ClassificationOrMappingColumnCountInvalid) for a malformed row.
             */
            static Mapping from_csv(const std::vector<std::string> &from_items,
                                    const std::string &filepath,
                                    char delimiter = ',');

            /**
             * @brief Construct from JSON {"from": [...], "to": [...]}.
             * @throws PerfAttrError (ClassificationOrMappingColumnCountInvalid) if either
             *         array is missing or their lengths differ.
             */
            static Mapping from_json(const std::vector<std::string> &from_items,
                                     const nlohmann::json &j);

            /**
             * @brief Map one item.
             * @return The mapped item, or the (lower-cased) item itself if it was not kept.
             */
            std::string map(const std::string &from_item) const;

            /** @brief Map every item, preserving order. */
            std::vector<std::string> map_all(const std::vector<std::string> &from_items) const;

            const std::map<std::string, std::string> &mappings() const { return mappings_; }

            size_t size() const { return mappings_.size(); }

        private:
            void keep_needed(const std::vector<std::string> &from_items,
                             const std::map<std::string, std::string> &all_mappings);

            std::map<std::string, std::string> mappings_;
        };

    } // namespace data
} // namespace perfattr

#endif // PERFATTR_DATA_MAPPING_HPP
