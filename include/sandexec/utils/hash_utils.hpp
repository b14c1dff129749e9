/**
 * @file hash_utils.hpp
 * @brief Cryptographic digest helpers
 *
 * Guest source code is never written to the log. Instead each execution is
 * tagged with the SHA-256 digest of the submitted code, which lets operators
 * correlate repeated submissions without exposing their content.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>

namespace sandexec {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed digest calculation
 *
 * **Thread Safety**: All methods are thread-safe and reentrant.
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a byte string
     * @param data Input bytes
     * @return Lowercase hexadecimal digest (64 characters)
     *
     * @throws std::runtime_error if OpenSSL fails to compute the digest
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Shortened SHA-256 suitable for log lines
     * @param data Input bytes
     * @param length Number of hex characters kept (default: 12)
     */
    static std::string ShortDigest(const std::string& data, std::size_t length = 12);
};

} // namespace utils
} // namespace sandexec
