/**
 * @file text.hpp
 * @brief Small string helpers for identifiers read from tables and files.
 */

#ifndef PERFATTR_CORE_TEXT_HPP
#define PERFATTR_CORE_TEXT_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace perfattr
{
    namespace core
    {

        inline std::string ltrim(std::string s)
        {
            s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
            return s;
        }

        inline std::string rtrim(std::string s)
        {
            s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
            return s;
        }

        inline std::string trim(std::string s)
        {
            return ltrim(rtrim(std::move(s)));
        }

        /** @brief ASCII lower case; identifiers are matched case-insensitively. */
        inline std::string to_lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
            return s;
        }

        /** @brief ASCII upper case, for displayed identifiers. */
        inline std::string to_upper(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
            return s;
        }

    } // namespace core
} // namespace perfattr

#endif // PERFATTR_CORE_TEXT_HPP
