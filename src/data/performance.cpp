/**
 * @file performance.cpp
 * @brief Implementation of the Performance class.
 */

#include "data/performance.hpp"
#include "analytics/linking.hpp"
#include "core/dates.hpp"
#include "core/errors.hpp"
#include "core/numeric.hpp"
#include "core/text.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace perfattr
{
    namespace data
    {

        namespace
        {

            void require_shape(const Eigen::MatrixXd &m, Eigen::Index rows, Eigen::Index cols,
                               const char *what)
            {
                if (m.rows() != rows || m.cols() != cols)
                {
                    std::ostringstream oss;
                    oss << "Performance: " << what << " panel is " << m.rows() << "x" << m.cols()
                        << ", expected " << rows << "x" << cols;
                    throw std::invalid_argument(oss.str());
                }
            }

        } // anonymous namespace

        // ===================================================================
        // Constructors
        // ===================================================================

        Performance::Performance(PerformanceData data)
            : data_(std::move(data))
        {
            validate_subperiods();
            validate_shapes();
            normalize_identifiers();
            validate_values();
            compute_derived();
        }

        Performance Performance::from_weights_and_returns(
            const std::string &name,
            core::Frequency frequency,
            const std::vector<Subperiod> &subperiods,
            const std::vector<std::string> &identifiers,
            const Eigen::MatrixXd &weights,
            const Eigen::MatrixXd &returns,
            const std::string &classification_name,
            const std::map<std::string, std::string> &classification_items)
        {
            if (weights.rows() != returns.rows() || weights.cols() != returns.cols())
            {
                throw std::invalid_argument("Performance: weights and returns must have the same shape");
            }

            PerformanceData data;
            data.name = name;
            data.classification_name = classification_name;
            data.frequency = frequency;
            data.subperiods = subperiods;
            data.identifiers = identifiers;
            data.weights = weights;
            data.returns = returns;
            data.contributions = weights.cwiseProduct(returns);
            data.consolidated_returns = returns;
            data.total_returns = data.contributions.rowwise().sum();
            data.subperiods_consolidated = false;
            data.classification_items = classification_items;

            return Performance(std::move(data));
        }

        int Performance::asset_index(const std::string &identifier) const
        {
            auto it = identifier_index_.find(core::to_lower(identifier));
            return (it == identifier_index_.end()) ? -1 : it->second;
        }

        // ===================================================================
        // Validation
        // ===================================================================

        void Performance::validate_subperiods() const
        {
            if (data_.subperiods.empty())
            {
                throw core::PerfAttrError(core::ErrorCode::NO_REPORTABLE_DATES,
                                          "Performance '" + data_.name + "' has no subperiods");
            }

            long previous_ending = 0;
            for (size_t t = 0; t < data_.subperiods.size(); ++t)
            {
                const auto &sp = data_.subperiods[t];
                long beginning = core::days_from_epoch(core::parse_date(sp.beginning_date));
                long ending = core::days_from_epoch(core::parse_date(sp.ending_date));

                if (beginning >= ending)
                {
                    throw core::PerfAttrError(core::ErrorCode::DISCONTINUOUS_SUBPERIODS,
                                              "Subperiod " + sp.beginning_date + " to " + sp.ending_date +
                                                  " does not end after it begins");
                }
                if (t > 0 && beginning != previous_ending)
                {
                    throw core::PerfAttrError(core::ErrorCode::DISCONTINUOUS_SUBPERIODS,
                                              "Subperiod beginning " + sp.beginning_date +
                                                  " does not follow " + data_.subperiods[t - 1].ending_date);
                }
                previous_ending = ending;
            }
        }

        void Performance::validate_shapes() const
        {
            const Eigen::Index rows = static_cast<Eigen::Index>(data_.subperiods.size());
            const Eigen::Index cols = static_cast<Eigen::Index>(data_.identifiers.size());

            if (cols == 0)
            {
                throw std::invalid_argument("Performance '" + data_.name + "' has no identifiers");
            }

            require_shape(data_.returns, rows, cols, "returns");
            require_shape(data_.weights, rows, cols, "weights");
            require_shape(data_.contributions, rows, cols, "contributions");
            require_shape(data_.consolidated_returns, rows, cols, "consolidated returns");

            if (data_.total_returns.size() != rows)
            {
                throw std::invalid_argument("Performance: total returns has " +
                                            std::to_string(data_.total_returns.size()) +
                                            " values, expected " + std::to_string(rows));
            }
        }

        void Performance::validate_values() const
        {
            if (data_.returns.hasNaN() || data_.weights.hasNaN() || data_.contributions.hasNaN() ||
                data_.consolidated_returns.hasNaN() || data_.total_returns.hasNaN())
            {
                throw core::PerfAttrError(core::ErrorCode::NAN_IN_RETURN_SERIES,
                                          "Performance '" + data_.name + "'");
            }

            Eigen::VectorXd weight_sums = data_.weights.rowwise().sum();
            for (Eigen::Index t = 0; t < weight_sums.size(); ++t)
            {
                if (!core::are_near(weight_sums(t), 1.0, core::Tolerance::LOW))
                {
                    std::ostringstream oss;
                    oss.precision(10);
                    oss << "Performance '" << data_.name << "' weights sum to " << weight_sums(t)
                        << " for " << data_.subperiods[t].beginning_date << " to "
                        << data_.subperiods[t].ending_date;
                    throw core::PerfAttrError(core::ErrorCode::WEIGHTS_DO_NOT_SUM_TO_ONE, oss.str());
                }
            }
        }

        void Performance::normalize_identifiers()
        {
            identifier_index_.clear();
            for (size_t i = 0; i < data_.identifiers.size(); ++i)
            {
                std::string id = core::to_lower(core::trim(data_.identifiers[i]));
                if (id.empty())
                {
                    throw std::invalid_argument("Performance: empty identifier at index " + std::to_string(i));
                }
                if (!identifier_index_.emplace(id, static_cast<int>(i)).second)
                {
                    throw std::invalid_argument("Performance: duplicate identifier '" + id + "'");
                }
                data_.identifiers[i] = id;
            }

            std::map<std::string, std::string> items;
            for (const auto &[id, item_name] : data_.classification_items)
            {
                items[core::to_lower(core::trim(id))] = item_name;
            }
            data_.classification_items = std::move(items);
        }

        // ===================================================================
        // Derived quantities
        // ===================================================================

        void Performance::compute_derived()
        {
            overall_return_ = (data_.total_returns.array() + 1.0).prod() - 1.0;
            linking_coefficients_ = analytics::log_linking_coefficients(overall_return_, data_.total_returns);

            quantity_of_days_.clear();
            quantity_of_days_.reserve(data_.subperiods.size());
            for (const auto &sp : data_.subperiods)
            {
                quantity_of_days_.push_back(core::days_between(sp.beginning_date, sp.ending_date));
            }

            overall_asset_returns_ = (data_.consolidated_returns.array() + 1.0).colwise().prod().transpose() - 1.0;
            overall_asset_weights_ = data_.weights.colwise().mean().transpose();
        }

    } // namespace data
} // namespace perfattr
