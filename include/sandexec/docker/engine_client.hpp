/**
 * @file engine_client.hpp
 * @brief Typed client for the subset of the Docker Engine API used by the sandbox
 *
 * | Operation        | Endpoint                                          |
 * |------------------|---------------------------------------------------|
 * | Ping             | GET    /_ping                                     |
 * | Version          | GET    /version                                   |
 * | ImageExists      | GET    /images/{ref}/json                         |
 * | PullImage        | POST   /images/create?fromImage=&tag=             |
 * | CreateContainer  | POST   /containers/create                         |
 * | StartContainer   | POST   /containers/{id}/start                     |
 * | WaitContainer    | POST   /containers/{id}/wait?condition=not-running |
 * | GetLogs          | GET    /containers/{id}/logs?stdout=1&stderr=1    |
 * | RemoveContainer  | DELETE /containers/{id}?force=1&v=1               |
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "engine_transport.hpp"
#include "sandexec/core/cancellation.hpp"
#include "sandexec/core/sandbox_spec.hpp"

namespace sandexec {
namespace docker {

/**
 * @struct ContainerLogs
 * @brief Demultiplexed container output
 */
struct ContainerLogs {
    std::string stdout_output;
    std::string stderr_output;
};

/**
 * @class DockerEngineClient
 * @brief Docker Engine API calls over an EngineTransport
 *
 * Failures are reported as core::ContainerRuntimeError carrying the
 * engine's own error message; cancellation as core::OperationCancelledError.
 *
 * **Usage Example**:
 * @code
 * auto transport = std::make_shared<CurlUnixSocketTransport>("/var/run/docker.sock");
 * DockerEngineClient client(transport);
 *
 * core::CancellationSource source;
 * if (client.Ping(source.Token())) {
 *     spdlog::info("Engine {}", client.Version(source.Token()));
 * }
 * @endcode
 */
class DockerEngineClient {
public:
    /**
     * @param transport Request channel
     * @param api_version Optional version prefix, e.g. "v1.41" (empty = engine default)
     */
    explicit DockerEngineClient(std::shared_ptr<EngineTransport> transport,
                                std::string api_version = "");

    /// True if the engine answered the ping
    bool Ping(const core::CancellationToken& token);

    /// Engine version string
    std::string Version(const core::CancellationToken& token);

    bool ImageExists(const std::string& image, const core::CancellationToken& token);

    /**
     * @brief Pull an image
     *
     * The engine streams one JSON progress object per line; any object
     * carrying an "error" member means the pull failed.
     */
    void PullImage(const std::string& image, const core::CancellationToken& token);

    /// @return Full container id
    std::string CreateContainer(const core::SandboxSpec& spec, const core::CancellationToken& token);

    void StartContainer(const std::string& id, const core::CancellationToken& token);

    /// @return Exit status, or nullopt if the engine's reply had none
    std::optional<int> WaitContainer(const std::string& id, const core::CancellationToken& token);

    ContainerLogs GetLogs(const std::string& id, const core::CancellationToken& token);

    /// Force removal including anonymous volumes. A container that is already gone counts as removed.
    void RemoveContainer(const std::string& id, const core::CancellationToken& token);

    /***************************************************************************
     * Wire helpers
     ***************************************************************************/

    /// Request body for POST /containers/create
    static nlohmann::json BuildCreateBody(const core::SandboxSpec& spec);

    /**
     * @brief Split a raw log stream into stdout and stderr
     *
     * Non-TTY containers prefix every chunk with an 8-byte header:
     * stream type (1 = stdout, 2 = stderr), three zero bytes and the
     * big-endian payload length. A stream that does not start with a valid
     * header is treated as raw stdout.
     */
    static ContainerLogs DemultiplexLogs(const std::string& raw);

    /// "python:3.12-slim" -> {"python", "3.12-slim"}; missing tag -> "latest"
    static std::pair<std::string, std::string> SplitImageReference(const std::string& image);

    /// Error text from an engine error body ({"message": ...}), or the raw body
    static std::string ExtractErrorMessage(const std::string& body);

private:
    EngineResponse Call(const std::string& method,
                        const std::string& path,
                        const core::CancellationToken& token,
                        const std::string& body = "");

    std::shared_ptr<EngineTransport> transport_;
    std::string prefix_;
};

} // namespace docker
} // namespace sandexec
