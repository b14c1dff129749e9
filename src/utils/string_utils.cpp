/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation and encoding utilities
 *
 * @date 2025
 */

#include "sandexec/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sandexec {
namespace utils {

namespace {

constexpr char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int, 256> BuildBase64Lookup() {
    std::array<int, 256> lookup{};
    lookup.fill(-1);
    for (int i = 0; i < 64; ++i) {
        lookup[static_cast<unsigned char>(kBase64Chars[i])] = i;
    }
    return lookup;
}

} // anonymous namespace

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.size() <= max_length) {
        return str;
    }
    return str.substr(0, max_length) + suffix;
}

// ============================================================================
// ENCODING
// ============================================================================

// Convert to Base64
std::string StringUtils::ToBase64(const std::string& data) {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    int val = 0;
    int valb = -6;

    for (unsigned char c : data) {
        val = ((val << 8) + c) & 0xFFFFFF;
        valb += 8;

        while (valb >= 0) {
            result.push_back(kBase64Chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }

    if (valb > -6) {
        result.push_back(kBase64Chars[(val << -valb) & 0x3F]);
    }

    while (result.size() % 4) {
        result.push_back('=');
    }

    return result;
}

// Convert from Base64
std::string StringUtils::FromBase64(const std::string& base64) {
    static const std::array<int, 256> lookup = BuildBase64Lookup();

    std::string result;
    result.reserve((base64.size() / 4) * 3);

    int val = 0;
    int valb = -8;

    for (unsigned char c : base64) {
        if (c == '=') {
            break;
        }
        if (lookup[c] == -1) {
            throw std::invalid_argument("Invalid base64 character");
        }
        val = ((val << 6) + lookup[c]) & 0xFFFFFF;
        valb += 6;

        if (valb >= 0) {
            result.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    return result;
}

bool StringUtils::IsBase64(const std::string& str) {
    static const std::array<int, 256> lookup = BuildBase64Lookup();
    return std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return c == '=' || lookup[c] != -1;
    });
}

std::string StringUtils::UrlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }

    return oss.str();
}

} // namespace utils
} // namespace sandexec
