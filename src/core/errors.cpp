/**
 * @file errors.cpp
 * @brief Implementation of the error taxonomy.
 */

#include "core/errors.hpp"

namespace perfattr
{
    namespace core
    {

        const char *error_code_name(ErrorCode code)
        {
            switch (code)
            {
            case ErrorCode::UNDEFINED_RETURN:
                return "UndefinedReturn";
            case ErrorCode::WEIGHTS_DO_NOT_SUM_TO_ONE:
                return "WeightsDoNotSumToOne";
            case ErrorCode::MISSING_CLASSIFICATION_NAME:
                return "MissingClassificationName";
            case ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID:
                return "ClassificationOrMappingColumnCountInvalid";
            case ErrorCode::TOO_MANY_ROWS_FOR_RENDER:
                return "TooManyRowsForRender";
            case ErrorCode::INVALID_FREQUENCY_FOR_RISK_STATISTICS:
                return "InvalidFrequencyForRiskStatistics";
            case ErrorCode::INSUFFICIENT_QUANTITY_OF_RETURNS:
                return "InsufficientQuantityOfReturns";
            case ErrorCode::RETURN_SERIES_LENGTH_MISMATCH:
                return "ReturnSeriesLengthMismatch";
            case ErrorCode::NAN_IN_RETURN_SERIES:
                return "NaNInReturnSeries";
            case ErrorCode::ARITHMETIC_IDENTITY_VIOLATION:
                return "ArithmeticIdentityViolation";
            case ErrorCode::CROSS_INSTANCE_INCONSISTENCY:
                return "CrossInstanceInconsistency";
            case ErrorCode::DATA_SOURCE_UNAVAILABLE:
                return "DataSourceUnavailable";
            case ErrorCode::MALFORMED_DATE_STRING:
                return "MalformedDateString";
            case ErrorCode::NO_REPORTABLE_DATES:
                return "NoReportableDates";
            case ErrorCode::DISCONTINUOUS_SUBPERIODS:
                return "DiscontinuousSubperiods";
            case ErrorCode::MISMATCHED_SUBPERIODS:
                return "MismatchedSubperiods";
            case ErrorCode::MALFORMED_CONFIG:
                return "MalformedConfig";
            }
            return "Unknown";
        }

        PerfAttrError::PerfAttrError(ErrorCode code, const std::string &detail)
            : std::runtime_error(std::string(error_code_name(code)) + ": " + detail), code_(code)
        {
        }

    } // namespace core
} // namespace perfattr
