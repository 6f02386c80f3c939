/**
 * @file errors.hpp
 * @brief Error taxonomy for attribution and risk statistics.
 *
 * Every failure detected by the library is raised synchronously as a
 * PerfAttrError carrying one ErrorCode. None of them are recoverable:
 * the caller is expected to stop rather than report unreliable numbers.
 */

#ifndef PERFATTR_CORE_ERRORS_HPP
#define PERFATTR_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace perfattr
{
    namespace core
    {

        /**
         * @enum ErrorCode
         * @brief Kind of failure, independent of the message text.
         */
        enum class ErrorCode
        {
            UNDEFINED_RETURN,                      ///< Return <= -100%, logarithm undefined
            WEIGHTS_DO_NOT_SUM_TO_ONE,             ///< Subperiod weights do not sum to 1.0
            MISSING_CLASSIFICATION_NAME,           ///< A classification name is required
            CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID, ///< Source must yield exactly 2 columns
            TOO_MANY_ROWS_FOR_RENDER,              ///< View too large for a renderer
            INVALID_FREQUENCY_FOR_RISK_STATISTICS, ///< Frequency without periods-per-year
            INSUFFICIENT_QUANTITY_OF_RETURNS,      ///< Fewer than 2 returns
            RETURN_SERIES_LENGTH_MISMATCH,         ///< Portfolio/benchmark lengths differ
            NAN_IN_RETURN_SERIES,                  ///< NaN found in an input series
            ARITHMETIC_IDENTITY_VIOLATION,         ///< Audit: internal identity does not hold
            CROSS_INSTANCE_INCONSISTENCY,          ///< Audit: instances built from different data
            DATA_SOURCE_UNAVAILABLE,               ///< File or source could not be read
            MALFORMED_DATE_STRING,                 ///< Date is not YYYY-MM-DD
            NO_REPORTABLE_DATES,                   ///< No subperiods to report on
            DISCONTINUOUS_SUBPERIODS,              ///< Gaps, overlaps or inverted subperiod bounds
            MISMATCHED_SUBPERIODS,                 ///< Portfolio/benchmark subperiod bounds differ
            MALFORMED_CONFIG                       ///< Configuration cannot be parsed
        };

        /**
         * @brief Stable name of an error code, used as the message prefix.
         * @param code Error code.
         * @return Name such as "UndefinedReturn".
         */
        const char *error_code_name(ErrorCode code);

        /**
         * @class PerfAttrError
         * @brief Exception raised for every ErrorCode.
         *
         * what() reads "<ErrorCodeName>: <detail>".
         */
        class PerfAttrError : public std::runtime_error
        {
        public:
            PerfAttrError(ErrorCode code, const std::string &detail);

            /** @brief The kind of failure. */
            ErrorCode code() const noexcept { return code_; }

        private:
            ErrorCode code_;
        };

    } // namespace core
} // namespace perfattr

#endif // PERFATTR_CORE_ERRORS_HPP
