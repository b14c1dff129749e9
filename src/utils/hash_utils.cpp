/**
 * @file hash_utils.cpp
 * @brief Implementation of digest helpers using OpenSSL EVP
 *
 * @date 2025
 */

#include "sandexec/utils/hash_utils.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sandexec {
namespace utils {

namespace {

/**
 * @brief Convert binary data to hexadecimal string
 * @param data Binary data buffer
 * @param length Number of bytes to convert
 * @return Lowercase hexadecimal string representation
 */
std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // anonymous namespace

// Compute SHA256 hash (string)
std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;

    if (EVP_Digest(data.data(), data.size(), hash, &hash_length,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest computation failed");
    }

    return BinaryToHex(hash, hash_length);
}

std::string HashUtils::ShortDigest(const std::string& data, std::size_t length) {
    return ComputeSHA256(data).substr(0, length);
}

} // namespace utils
} // namespace sandexec
