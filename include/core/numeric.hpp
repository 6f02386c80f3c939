/**
 * @file numeric.hpp
 * @brief Floating-point comparison tolerances shared by the engines.
 */

#ifndef PERFATTR_CORE_NUMERIC_HPP
#define PERFATTR_CORE_NUMERIC_HPP

#include <cmath>

namespace perfattr
{
    namespace core
    {

        /**
         * @enum Tolerance
         * @brief Nearness tolerances, loosest first.
         */
        enum class Tolerance
        {
            LOW,    ///< 5e-8, identities between independently computed columns
            MEDIUM, ///< 5e-10, vertical sums that accumulate rounding error
            HIGH    ///< 5e-13, branch switches in the linking math
        };

        /** @brief Numeric value of a tolerance. */
        inline double tolerance_value(Tolerance tolerance)
        {
            switch (tolerance)
            {
            case Tolerance::LOW:
                return 0.00000005;
            case Tolerance::MEDIUM:
                return 0.0000000005;
            case Tolerance::HIGH:
                return 0.0000000000005;
            }
            return 0.0;
        }

        /**
         * @brief True if |a - b| is strictly below the tolerance.
         */
        inline bool are_near(double a, double b, Tolerance tolerance = Tolerance::HIGH)
        {
            return std::abs(a - b) < tolerance_value(tolerance);
        }

        /** @brief True if x is within the tolerance of zero. */
        inline bool near_zero(double x, Tolerance tolerance = Tolerance::HIGH)
        {
            return are_near(x, 0.0, tolerance);
        }

    } // namespace core
} // namespace perfattr

#endif // PERFATTR_CORE_NUMERIC_HPP
