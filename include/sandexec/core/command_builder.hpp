/**
 * @file command_builder.hpp
 * @brief Shell-injection-proof container command construction
 *
 * Guest source is never interpolated into a shell string. It is base64
 * encoded and only the encoded form appears in the generated command:
 *
 * ```
 * sh -c "echo '<base64>' | base64 -d | <interpreter>"
 * ```
 *
 * The base64 alphabet cannot terminate the single-quoted word, so the shell
 * line is syntactically fixed whatever the payload contains.
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "language_catalog.hpp"

namespace sandexec {
namespace core {

/**
 * @class CommandBuilder
 * @brief Builds the container argv for a language and source text
 *
 * Build() is a pure function of (language, source): identical inputs always
 * yield byte-identical argv.
 */
class CommandBuilder {
public:
    explicit CommandBuilder(const LanguageCatalog& catalog = LanguageCatalog::Default());

    /**
     * @brief Build container command
     * @param language Language identifier
     * @param source Guest program (arbitrary bytes)
     * @return argv of the form {"sh", "-c", "<decode> | <interpreter>"}
     *
     * @throws InputError (UNSUPPORTED_LANGUAGE) if the language is unknown
     */
    std::vector<std::string> Build(const std::string& language,
                                   const std::string& source) const;

    /**
     * @brief Recover the base64 segment embedded in a built command
     * @param argv Command produced by Build()
     * @return Encoded payload, or nullopt if argv does not have the expected shape
     */
    static std::optional<std::string> ExtractPayload(const std::vector<std::string>& argv);

private:
    const LanguageCatalog& catalog_;
};

} // namespace core
} // namespace sandexec
