/**
 * @file classification.hpp
 * @brief Classification items: identifier to display name.
 *
 * A classification (e.g. "Security", "Gics Sector") labels the
 * identifiers attributed by an Attribution. Sample rows of a "Security"
 * classification:
 *
 *   AAPL, Apple Inc.
 *   MSFT, Microsoft
 */

#ifndef PERFATTR_DATA_CLASSIFICATION_HPP
#define PERFATTR_DATA_CLASSIFICATION_HPP

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace perfattr
{
    namespace data
    {

        class Performance;

        /**
         * @class Classification
         * @brief Named lookup table of classification items.
         *
         * Identifiers are stored in lower case and looked up case-insensitively.
         *
         * Thread safety: immutable after construction.
         */
        class Classification
        {
        public:
            /** @brief Unnamed classification without items. */
            Classification() = default;

            /**
             * @brief Construct from two-column rows (identifier, display name).
             * @param name Classification name.
             * @param rows Tabular rows; each must have exactly 2 columns.
             * @throws PerfAttrError (ClassificationOrMappingColumnCountInvalid) otherwise.
             */
            Classification(const std::string &name,
                           const std::vector<std::vector<std::string>> &rows);

            /** @brief Construct from an identifier -> display name dictionary. */
            static Classification from_map(const std::string &name,
                                           const std::map<std::string, std::string> &items);

            /**
             * @brief Load a headerless CSV file of identifier, display name rows.
             * @throws PerfAttrError (DataSourceUnavailable) if the file cannot be opened.
             * @throws PerfAttrError (ClassificationOrMappingColumnCountInvalid) for a malformed row.
             */
            static Classification from_csv(const std::string &name,
                                           const std::string &filepath,
                                           char delimiter = ',');

            /**
             * @brief Construct from JSON {"identifiers": [...], "names": [...]}.
             * @throws PerfAttrError (ClassificationOrMappingColumnCountInvalid) if either
             *         array is missing or their lengths differ.
             */
            static Classification from_json(const std::string &name, const nlohmann::json &j);

            /**
             * @brief Default classification from the performances' own items.
             *
             * The name is the one both sides declare (empty if neither does).
             * Items of the portfolio take precedence over those of the benchmark.
             *
             * @throws PerfAttrError (MissingClassificationName) if the two sides
             *         declare different classifications.
             */
            static Classification infer(const Performance &portfolio, const Performance &benchmark);

            const std::string &name() const { return name_; }

            /** @brief True if the identifier has a display name. */
            bool contains(const std::string &identifier) const;

            /**
             * @brief Display name of an identifier.
             * @return The name, or an empty string if the identifier is unknown.
             */
            std::string name_for(const std::string &identifier) const;

            const std::map<std::string, std::string> &items() const { return items_; }

            size_t size() const { return items_.size(); }
            bool empty() const { return items_.empty(); }

        private:
            std::string name_;
            std::map<std::string, std::string> items_; ///< lower-case identifier -> display name
        };

    } // namespace data
} // namespace perfattr

#endif // PERFATTR_DATA_CLASSIFICATION_HPP
