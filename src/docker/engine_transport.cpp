/**
 * @file engine_transport.cpp
 * @brief curl subprocess transport for the Docker Engine API
 *
 * @date 2025
 */

#include "sandexec/docker/engine_transport.hpp"
#include "sandexec/core/errors.hpp"
#include "sandexec/utils/process_utils.hpp"
#include "sandexec/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace sandexec {
namespace docker {

namespace {

// Pseudo host; curl requires one, the engine ignores it
constexpr char kBaseUrl[] = "http://localhost";

} // anonymous namespace

CurlUnixSocketTransport::CurlUnixSocketTransport(std::string socket_path,
                                                 std::string curl_binary)
    : socket_path_(std::move(socket_path))
    , curl_binary_(std::move(curl_binary)) {}

std::vector<std::string> CurlUnixSocketTransport::BuildArgv(const EngineRequest& request) const {
    std::vector<std::string> argv = {
        curl_binary_,
        "--silent",
        "--show-error",
        "--unix-socket", socket_path_,
        "--request", request.method,
    };

    for (const auto& [name, value] : request.headers) {
        argv.push_back("--header");
        argv.push_back(name + ": " + value);
    }

    if (!request.body.empty()) {
        argv.push_back("--header");
        argv.push_back("Content-Type: application/json");
        argv.push_back("--data-binary");
        argv.push_back("@-");
    }

    argv.push_back("--write-out");
    argv.push_back("\n%{http_code}");
    argv.push_back(std::string(kBaseUrl) + request.path);

    return argv;
}

EngineResponse CurlUnixSocketTransport::ParseOutput(const std::string& output) {
    auto newline = output.rfind('\n');
    if (newline == std::string::npos) {
        throw core::ContainerRuntimeError("malformed engine response: missing status line");
    }

    std::string status_text = utils::StringUtils::Trim(output.substr(newline + 1));
    EngineResponse response;
    try {
        std::size_t consumed = 0;
        response.status = std::stoi(status_text, &consumed);
        if (consumed != status_text.size()) {
            throw std::invalid_argument(status_text);
        }
    } catch (const std::exception&) {
        throw core::ContainerRuntimeError("malformed engine response status: '" + status_text + "'");
    }

    response.body = output.substr(0, newline);
    return response;
}

EngineResponse CurlUnixSocketTransport::Send(const EngineRequest& request,
                                             const core::CancellationToken& token) {
    utils::ProcessOptions options;
    options.stdin_data = request.body;

    spdlog::debug("Engine API: {} {}", request.method, request.path);

    utils::ProcessResult result;
    try {
        result = utils::ProcessRunner::Run(BuildArgv(request), token, options);
    } catch (const utils::ProcessError& e) {
        throw core::ContainerRuntimeError(std::string("cannot run curl: ") + e.what());
    }

    if (!result.success) {
        throw core::ContainerRuntimeError(
            "cannot reach container engine at " + socket_path_ + ": " +
            utils::StringUtils::Trim(result.stderr_output));
    }

    auto response = ParseOutput(result.stdout_output);
    if (response.status == 0) {
        throw core::ContainerRuntimeError("no HTTP response from container engine at " + socket_path_);
    }

    spdlog::trace("Engine API: {} {} -> {}", request.method, request.path, response.status);
    return response;
}

} // namespace docker
} // namespace sandexec
