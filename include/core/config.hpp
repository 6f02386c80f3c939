/**
 * @file config.hpp
 * @brief Analysis configuration loaded from JSON.
 *
 * Expected layout (every key optional, defaults shown):
 * @code
 * {
 *   "risk_statistics": {
 *     "frequency": "monthly",
 *     "annual_minimum_acceptable_return": 0.0,
 *     "annual_risk_free_rate": 0.03,
 *     "confidence_level": 0.95,
 *     "portfolio_value": 100000.0
 *   },
 *   "attribution": {
 *     "classification_name": "",
 *     "max_render_rows": 500
 *   }
 * }
 * @endcode
 */

#ifndef PERFATTR_CORE_CONFIG_HPP
#define PERFATTR_CORE_CONFIG_HPP

#include "core/frequency.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace perfattr
{
    namespace core
    {

        /**
         * @struct RiskParameters
         * @brief Annual rates and VaR settings for the risk statistics engine.
         */
        struct RiskParameters
        {
            double annual_minimum_acceptable_return = 0.0; ///< MAR for downside statistics
            double annual_risk_free_rate = 0.03;           ///< Risk-free rate for excess returns
            double confidence_level = 0.95;                ///< VaR confidence level, in (0, 1)
            double portfolio_value = 100000.0;             ///< Currency value for VaR

            static RiskParameters from_json(const nlohmann::json &j);
        };

        /**
         * @struct RiskStatisticsConfig
         * @brief Frequency plus parameters of the risk statistics section.
         */
        struct RiskStatisticsConfig
        {
            Frequency frequency = Frequency::MONTHLY;
            RiskParameters parameters;

            static RiskStatisticsConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct AttributionConfig
         * @brief Settings of the attribution section.
         */
        struct AttributionConfig
        {
            std::string classification_name;  ///< Empty: infer from the performances
            std::size_t max_render_rows = 500; ///< Row guard for view_for_rendering()

            static AttributionConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct AnalysisConfig
         * @brief Complete configuration.
         */
        struct AnalysisConfig
        {
            RiskStatisticsConfig risk_statistics;
            AttributionConfig attribution;

            /**
             * @brief Build from a parsed JSON document.
             * @throws PerfAttrError (MalformedConfig) on wrongly typed values.
             */
            static AnalysisConfig from_json(const nlohmann::json &j);

            /**
             * @brief Parse JSON text.
             * @throws PerfAttrError (MalformedConfig) if the text is not valid JSON.
             */
            static AnalysisConfig parse(const std::string &text);

            /**
             * @brief Load from a JSON file.
             * @throws PerfAttrError (DataSourceUnavailable) if the file cannot be opened.
             * @throws PerfAttrError (MalformedConfig) if it does not hold a valid configuration.
             */
            static AnalysisConfig load_from_file(const std::string &config_path);
        };

    } // namespace core
} // namespace perfattr

#endif // PERFATTR_CORE_CONFIG_HPP
