/**
 * @file string_utils.hpp
 * @brief String manipulation and encoding utilities
 *
 * Provides the small set of string helpers used across the sandbox engine:
 * trimming, splitting, joining, prefix checks, base64 encoding of guest
 * source, and percent-encoding of Docker Engine API query parameters.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace sandexec {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * std::string encoded = StringUtils::ToBase64("print('hi')");
 * std::string decoded = StringUtils::FromBase64(encoded);
 *
 * auto parts = StringUtils::Split("size=16m,noexec,nosuid", ',');
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /// Strip leading and trailing whitespace
    static std::string Trim(const std::string& str);

    /// Lowercase copy (ASCII only)
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @param str Input string
     * @param delimiter Separator character
     * @return Tokens (empty tokens are skipped)
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     * @param strings Strings to join
     * @param delimiter Separator placed between elements
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Truncate string to a maximum length
     * @param str Input string
     * @param max_length Maximum number of bytes kept
     * @param suffix Appended when truncation happened
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");

    /***************************************************************************
     * Encoding
     ***************************************************************************/

    /**
     * @brief Encode arbitrary bytes as standard (RFC 4648) base64 with padding
     *
     * The output alphabet is restricted to `[A-Za-z0-9+/=]`, so the result can
     * be embedded inside a single-quoted shell word without escaping.
     */
    static std::string ToBase64(const std::string& data);

    /**
     * @brief Decode standard base64
     *
     * Decoding stops at the first padding character.
     *
     * @throws std::invalid_argument on characters outside the base64 alphabet
     */
    static std::string FromBase64(const std::string& base64);

    /// True if every character belongs to the base64 alphabet (padding included)
    static bool IsBase64(const std::string& str);

    /**
     * @brief Percent-encode a value for use in a URL query or path segment
     *
     * Unreserved characters (`A-Z a-z 0-9 - _ . ~`) are kept as-is.
     */
    static std::string UrlEncode(const std::string& value);
};

} // namespace utils
} // namespace sandexec
