/**
 * @file language_catalog.cpp
 * @brief Built-in language table and lookup
 *
 * @date 2025
 */

#include "sandexec/core/language_catalog.hpp"
#include "sandexec/core/errors.hpp"

#include <set>
#include <stdexcept>

namespace sandexec {
namespace core {

LanguageCatalog::LanguageCatalog(std::vector<LanguageProfile> profiles)
    : profiles_(std::move(profiles)) {

    std::set<std::string> seen;
    for (const auto& profile : profiles_) {
        if (profile.id.empty() || profile.image.empty() || profile.interpreter.empty()) {
            throw std::invalid_argument("Language profile requires id, image and interpreter");
        }
        if (!seen.insert(profile.id).second) {
            throw std::invalid_argument("Duplicate language profile: " + profile.id);
        }
    }
}

const LanguageCatalog& LanguageCatalog::Default() {
    static const LanguageCatalog catalog({
        {"python",     "python:3.12-slim", "python3"},
        {"bash",       "alpine:3.20",      "sh"},
        {"javascript", "node:20-slim",     "node"},
    });
    return catalog;
}

const LanguageProfile& LanguageCatalog::Resolve(const std::string& language) const {
    const auto* profile = Lookup(language);
    if (profile == nullptr) {
        throw InputError(InputErrorCode::UNSUPPORTED_LANGUAGE,
                         "unsupported language: " + language);
    }
    return *profile;
}

std::optional<LanguageProfile> LanguageCatalog::Find(const std::string& language) const {
    const auto* profile = Lookup(language);
    if (profile == nullptr) {
        return std::nullopt;
    }
    return *profile;
}

bool LanguageCatalog::IsSupported(const std::string& language) const {
    return Lookup(language) != nullptr;
}

std::vector<std::string> LanguageCatalog::SupportedLanguages() const {
    std::vector<std::string> ids;
    ids.reserve(profiles_.size());
    for (const auto& profile : profiles_) {
        ids.push_back(profile.id);
    }
    return ids;
}

const LanguageProfile* LanguageCatalog::Lookup(const std::string& language) const {
    for (const auto& profile : profiles_) {
        if (profile.id == language) {
            return &profile;
        }
    }
    return nullptr;
}

} // namespace core
} // namespace sandexec
