/**
 * @file string_utils.hpp
 * @brief Small string helpers shared by the engine adapter and config layer
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace sandkeep {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string manipulation helpers
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, skipping empty tokens
     * @param str Input string
     * @param delimiter Delimiter character
     * @return Vector of tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);

    /**
     * @brief Case-insensitive substring check
     */
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);

    /**
     * @brief Percent-encode a string for use in a URL query component
     */
    static std::string UrlEncode(const std::string& str);
};

} // namespace utils
} // namespace sandkeep
