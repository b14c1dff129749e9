/**
 * @file command_builder.cpp
 * @brief Implementation of the base64 pipeline command builder
 *
 * @date 2025
 */

#include "sandexec/core/command_builder.hpp"
#include "sandexec/utils/string_utils.hpp"

namespace sandexec {
namespace core {

namespace {

constexpr char kShell[] = "sh";
constexpr char kShellFlag[] = "-c";
constexpr char kEchoPrefix[] = "echo '";
constexpr char kDecodeSuffix[] = "' | base64 -d | ";

} // anonymous namespace

CommandBuilder::CommandBuilder(const LanguageCatalog& catalog)
    : catalog_(catalog) {}

std::vector<std::string> CommandBuilder::Build(const std::string& language,
                                               const std::string& source) const {
    const auto& profile = catalog_.Resolve(language);
    const std::string encoded = utils::StringUtils::ToBase64(source);

    std::string pipeline;
    pipeline.reserve(encoded.size() + profile.interpreter.size() + 32);
    pipeline += kEchoPrefix;
    pipeline += encoded;
    pipeline += kDecodeSuffix;
    pipeline += profile.interpreter;

    return {kShell, kShellFlag, pipeline};
}

std::optional<std::string> CommandBuilder::ExtractPayload(const std::vector<std::string>& argv) {
    if (argv.size() != 3 || argv[0] != kShell || argv[1] != kShellFlag) {
        return std::nullopt;
    }

    const std::string& pipeline = argv[2];
    if (!utils::StringUtils::StartsWith(pipeline, kEchoPrefix)) {
        return std::nullopt;
    }

    const auto begin = sizeof(kEchoPrefix) - 1;
    const auto end = pipeline.find(kDecodeSuffix, begin);
    if (end == std::string::npos) {
        return std::nullopt;
    }

    std::string payload = pipeline.substr(begin, end - begin);
    if (!utils::StringUtils::IsBase64(payload)) {
        return std::nullopt;
    }
    return payload;
}

} // namespace core
} // namespace sandexec
