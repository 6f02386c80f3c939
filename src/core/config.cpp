/**
 * @file config.cpp
 * @brief JSON parsing of the analysis configuration.
 */

#include "core/config.hpp"
#include "core/errors.hpp"

#include <fstream>

namespace perfattr
{
    namespace core
    {

        // ===================================================================
        // Sections
        // ===================================================================

        RiskParameters RiskParameters::from_json(const nlohmann::json &j)
        {
            RiskParameters params;
            params.annual_minimum_acceptable_return = j.value("annual_minimum_acceptable_return", 0.0);
            params.annual_risk_free_rate = j.value("annual_risk_free_rate", 0.03);
            params.confidence_level = j.value("confidence_level", 0.95);
            params.portfolio_value = j.value("portfolio_value", 100000.0);
            return params;
        }

        RiskStatisticsConfig RiskStatisticsConfig::from_json(const nlohmann::json &j)
        {
            RiskStatisticsConfig config;
            config.frequency = frequency_from_string(j.value("frequency", "monthly"));
            config.parameters = RiskParameters::from_json(j);
            return config;
        }

        AttributionConfig AttributionConfig::from_json(const nlohmann::json &j)
        {
            AttributionConfig config;
            config.classification_name = j.value("classification_name", "");
            config.max_render_rows = j.value("max_render_rows", static_cast<std::size_t>(500));
            return config;
        }

        // ===================================================================
        // Whole document
        // ===================================================================

        AnalysisConfig AnalysisConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw PerfAttrError(ErrorCode::MALFORMED_CONFIG, "Configuration must be a JSON object");
            }

            AnalysisConfig config;
            try
            {
                if (j.contains("risk_statistics"))
                {
                    config.risk_statistics = RiskStatisticsConfig::from_json(j["risk_statistics"]);
                }
                if (j.contains("attribution"))
                {
                    config.attribution = AttributionConfig::from_json(j["attribution"]);
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw PerfAttrError(ErrorCode::MALFORMED_CONFIG, e.what());
            }
            return config;
        }

        AnalysisConfig AnalysisConfig::parse(const std::string &text)
        {
            nlohmann::json j;
            try
            {
                j = nlohmann::json::parse(text);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw PerfAttrError(ErrorCode::MALFORMED_CONFIG,
                                    "JSON parsing error: " + std::string(e.what()));
            }
            return from_json(j);
        }

        AnalysisConfig AnalysisConfig::load_from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw PerfAttrError(ErrorCode::DATA_SOURCE_UNAVAILABLE,
                                    "Could not open JSON file: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw PerfAttrError(ErrorCode::MALFORMED_CONFIG,
                                    "JSON parsing error: " + std::string(e.what()));
            }

            return from_json(j);
        }

    } // namespace core
} // namespace perfattr
