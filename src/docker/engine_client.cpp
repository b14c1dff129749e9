/**
 * @file engine_client.cpp
 * @brief Docker Engine API request construction and response parsing
 *
 * @date 2025
 */

#include "sandexec/docker/engine_client.hpp"
#include "sandexec/core/errors.hpp"
#include "sandexec/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace sandexec {
namespace docker {

using json = nlohmann::json;
using core::ContainerRuntimeError;

namespace {

constexpr std::size_t kFrameHeaderSize = 8;

enum StreamType : unsigned char {
    STREAM_STDIN = 0,
    STREAM_STDOUT = 1,
    STREAM_STDERR = 2
};

json ParseBody(const std::string& body, const std::string& context) {
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw ContainerRuntimeError(context + ": invalid engine response: " + e.what());
    }
}

/// String member of an engine reply, or the fallback when absent or of another type
std::string StringMember(const json& object, const char* key, const std::string& fallback) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return fallback;
}

} // anonymous namespace

// ============================================================================
// Construction / transport
// ============================================================================

DockerEngineClient::DockerEngineClient(std::shared_ptr<EngineTransport> transport,
                                       std::string api_version)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("DockerEngineClient requires a transport");
    }
    if (!api_version.empty()) {
        prefix_ = "/" + api_version;
    }
}

EngineResponse DockerEngineClient::Call(const std::string& method,
                                        const std::string& path,
                                        const core::CancellationToken& token,
                                        const std::string& body) {
    EngineRequest request;
    request.method = method;
    request.path = prefix_ + path;
    request.body = body;
    return transport_->Send(request, token);
}

std::string DockerEngineClient::ExtractErrorMessage(const std::string& body) {
    auto parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() &&
        parsed.contains("message") && parsed["message"].is_string()) {
        return parsed["message"].get<std::string>();
    }
    return utils::StringUtils::Truncate(utils::StringUtils::Trim(body), 256);
}

// ============================================================================
// Daemon
// ============================================================================

bool DockerEngineClient::Ping(const core::CancellationToken& token) {
    try {
        auto response = Call("GET", "/_ping", token);
        return response.status == 200 && utils::StringUtils::Trim(response.body) == "OK";
    } catch (const core::OperationCancelledError&) {
        throw;
    } catch (const ContainerRuntimeError& e) {
        spdlog::debug("Engine ping failed: {}", e.what());
        return false;
    }
}

std::string DockerEngineClient::Version(const core::CancellationToken& token) {
    auto response = Call("GET", "/version", token);
    if (!response.IsSuccess()) {
        throw ContainerRuntimeError("version query failed: " + ExtractErrorMessage(response.body));
    }
    auto body = ParseBody(response.body, "version query");
    std::string version = StringMember(body, "Version", "unknown");
    std::string api = StringMember(body, "ApiVersion", "");
    return api.empty() ? version : version + " (API " + api + ")";
}

// ============================================================================
// Images
// ============================================================================

std::pair<std::string, std::string> DockerEngineClient::SplitImageReference(const std::string& image) {
    if (image.find('@') != std::string::npos) {
        return {image, ""};
    }

    auto colon = image.rfind(':');
    auto slash = image.rfind('/');
    if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
        return {image, "latest"};
    }
    return {image.substr(0, colon), image.substr(colon + 1)};
}

bool DockerEngineClient::ImageExists(const std::string& image, const core::CancellationToken& token) {
    auto response = Call("GET", "/images/" + image + "/json", token);
    if (response.status == 200) {
        return true;
    }
    if (response.status == 404) {
        return false;
    }
    throw ContainerRuntimeError("image inspect failed: " + ExtractErrorMessage(response.body));
}

void DockerEngineClient::PullImage(const std::string& image, const core::CancellationToken& token) {
    auto [name, tag] = SplitImageReference(image);

    std::string path = "/images/create?fromImage=" + utils::StringUtils::UrlEncode(name);
    if (!tag.empty()) {
        path += "&tag=" + utils::StringUtils::UrlEncode(tag);
    }

    spdlog::info("Pulling image {}...", image);
    auto response = Call("POST", path, token);
    if (!response.IsSuccess()) {
        throw ContainerRuntimeError(ExtractErrorMessage(response.body));
    }

    // Progress stream: one JSON object per line
    for (const auto& line : utils::StringUtils::Split(response.body, '\n')) {
        auto trimmed = utils::StringUtils::Trim(line);
        if (trimmed.empty()) {
            continue;
        }
        auto event = json::parse(trimmed, nullptr, false);
        if (event.is_discarded() || !event.is_object()) {
            continue;
        }
        if (event.contains("error")) {
            std::string message = event["error"].is_string()
                ? event["error"].get<std::string>()
                : event["error"].dump();
            throw ContainerRuntimeError(message);
        }
    }

    spdlog::info("✓ Image pulled: {}", image);
}

// ============================================================================
// Containers
// ============================================================================

json DockerEngineClient::BuildCreateBody(const core::SandboxSpec& spec) {
    json host_config = {
        {"Memory", spec.memory_limit_bytes},
        {"MemorySwap", spec.memory_swap_bytes},
        {"NanoCpus", spec.cpu_nanos},
        {"PidsLimit", spec.pids_limit},
        {"NetworkMode", spec.network_mode},
        {"ReadonlyRootfs", spec.readonly_rootfs},
        {"Tmpfs", spec.tmpfs_mounts},
        {"CapDrop", spec.cap_drop},
        {"SecurityOpt", spec.security_opt},
        {"Privileged", spec.privileged},
        {"AutoRemove", spec.auto_remove},
        {"Binds", spec.binds},
    };

    return json{
        {"Image", spec.image},
        {"Cmd", spec.command},
        {"NetworkDisabled", spec.network_disabled},
        {"Labels", spec.labels},
        {"AttachStdin", false},
        {"OpenStdin", false},
        {"Tty", false},
        {"HostConfig", host_config},
    };
}

std::string DockerEngineClient::CreateContainer(const core::SandboxSpec& spec,
                                                const core::CancellationToken& token) {
    auto response = Call("POST", "/containers/create", token, BuildCreateBody(spec).dump());
    if (response.status != 201 && response.status != 200) {
        throw ContainerRuntimeError(ExtractErrorMessage(response.body));
    }

    auto body = ParseBody(response.body, "create");
    if (!body.contains("Id") || !body["Id"].is_string() || body["Id"].get<std::string>().empty()) {
        throw ContainerRuntimeError("create: engine returned no container id");
    }

    if (body.contains("Warnings") && body["Warnings"].is_array()) {
        for (const auto& warning : body["Warnings"]) {
            if (warning.is_string()) {
                spdlog::warn("Engine warning: {}", warning.get<std::string>());
            }
        }
    }

    return body["Id"].get<std::string>();
}

void DockerEngineClient::StartContainer(const std::string& id, const core::CancellationToken& token) {
    auto response = Call("POST", "/containers/" + id + "/start", token);
    // 304: already started
    if (response.status != 204 && response.status != 304 && !response.IsSuccess()) {
        throw ContainerRuntimeError(ExtractErrorMessage(response.body));
    }
}

std::optional<int> DockerEngineClient::WaitContainer(const std::string& id,
                                                     const core::CancellationToken& token) {
    auto response = Call("POST", "/containers/" + id + "/wait?condition=not-running", token);
    if (!response.IsSuccess()) {
        throw ContainerRuntimeError(ExtractErrorMessage(response.body));
    }

    auto body = ParseBody(response.body, "wait");

    if (body.contains("Error") && body["Error"].is_object()) {
        std::string message = StringMember(body["Error"], "Message", "");
        if (!message.empty()) {
            throw ContainerRuntimeError(message);
        }
    }

    if (!body.is_object() || !body.contains("StatusCode") || !body["StatusCode"].is_number_integer()) {
        return std::nullopt;
    }
    auto status = body["StatusCode"].get<std::int64_t>();
    if (status < std::numeric_limits<int>::min() || status > std::numeric_limits<int>::max()) {
        throw ContainerRuntimeError("wait: exit status out of range: " + std::to_string(status));
    }
    return static_cast<int>(status);
}

ContainerLogs DockerEngineClient::DemultiplexLogs(const std::string& raw) {
    ContainerLogs logs;
    std::size_t offset = 0;

    while (offset < raw.size()) {
        if (raw.size() - offset < kFrameHeaderSize) {
            logs.stdout_output.append(raw, offset, std::string::npos);
            break;
        }

        const auto* header = reinterpret_cast<const unsigned char*>(raw.data() + offset);
        unsigned char stream = header[0];
        bool valid_header = stream <= STREAM_STDERR &&
                            header[1] == 0 && header[2] == 0 && header[3] == 0;
        if (!valid_header) {
            // TTY containers produce an unframed stream
            logs.stdout_output.append(raw, offset, std::string::npos);
            break;
        }

        std::uint32_t size = (static_cast<std::uint32_t>(header[4]) << 24) |
                             (static_cast<std::uint32_t>(header[5]) << 16) |
                             (static_cast<std::uint32_t>(header[6]) << 8) |
                             static_cast<std::uint32_t>(header[7]);
        offset += kFrameHeaderSize;

        std::size_t available = std::min<std::size_t>(size, raw.size() - offset);
        std::string& target = (stream == STREAM_STDERR) ? logs.stderr_output : logs.stdout_output;
        target.append(raw, offset, available);
        offset += available;
    }

    return logs;
}

ContainerLogs DockerEngineClient::GetLogs(const std::string& id, const core::CancellationToken& token) {
    auto response = Call("GET", "/containers/" + id + "/logs?stdout=1&stderr=1", token);
    if (!response.IsSuccess()) {
        throw ContainerRuntimeError(ExtractErrorMessage(response.body));
    }
    return DemultiplexLogs(response.body);
}

void DockerEngineClient::RemoveContainer(const std::string& id, const core::CancellationToken& token) {
    auto response = Call("DELETE", "/containers/" + id + "?force=1&v=1", token);
    if (response.status == 404) {
        spdlog::debug("Container {} already gone", id.substr(0, 12));
        return;
    }
    if (!response.IsSuccess()) {
        throw ContainerRuntimeError(ExtractErrorMessage(response.body));
    }
}

} // namespace docker
} // namespace sandexec
