/**
 * @file language_catalog.hpp
 * @brief Static routing table from language identifier to sandbox image
 *
 * Each supported language maps to one minimal, pinned base image and the
 * interpreter that reads the decoded guest program from standard input.
 * The catalog is read-only after construction and may be shared freely
 * between concurrent executions.
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sandexec {
namespace core {

/**
 * @struct LanguageProfile
 * @brief Container image and interpreter invocation for one language
 */
struct LanguageProfile {
    std::string id;           ///< Identifier accepted in requests ("python")
    std::string image;        ///< Pinned image reference ("python:3.12-slim")
    std::string interpreter;  ///< Command reading the program from stdin ("python3")
};

/**
 * @class LanguageCatalog
 * @brief Immutable language → image/interpreter table
 *
 * **Usage Example**:
 * @code
 * const auto& catalog = LanguageCatalog::Default();
 * const auto& profile = catalog.Resolve("bash");
 * // profile.image == "alpine:3.20", profile.interpreter == "sh"
 * @endcode
 */
class LanguageCatalog {
public:
    /**
     * @brief Construct catalog from explicit profiles
     * @param profiles Supported languages, in presentation order
     *
     * @throws std::invalid_argument on duplicate or incomplete profiles
     */
    explicit LanguageCatalog(std::vector<LanguageProfile> profiles);

    /// Built-in catalog: python, bash, javascript
    static const LanguageCatalog& Default();

    /**
     * @brief Resolve language identifier
     * @param language Identifier from the request (case-sensitive)
     * @return Matching profile
     *
     * @throws InputError (UNSUPPORTED_LANGUAGE) if the identifier is unknown
     */
    const LanguageProfile& Resolve(const std::string& language) const;

    std::optional<LanguageProfile> Find(const std::string& language) const;

    bool IsSupported(const std::string& language) const;

    /// Identifiers in presentation order (used for the input schema enum)
    std::vector<std::string> SupportedLanguages() const;

    const std::vector<LanguageProfile>& Profiles() const { return profiles_; }

private:
    const LanguageProfile* Lookup(const std::string& language) const;

    std::vector<LanguageProfile> profiles_;
};

} // namespace core
} // namespace sandexec
