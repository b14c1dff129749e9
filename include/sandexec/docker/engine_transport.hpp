/**
 * @file engine_transport.hpp
 * @brief HTTP exchange with the Docker Engine API
 *
 * The engine listens on a unix socket. The production transport drives the
 * curl binary with --unix-socket through ProcessRunner: request bodies are
 * fed on stdin and the HTTP status is appended to the output with
 * --write-out, so no request content ever appears on a command line.
 *
 * @date 2025
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "sandexec/core/cancellation.hpp"

namespace sandexec {
namespace docker {

/**
 * @struct EngineRequest
 * @brief One Engine API call
 */
struct EngineRequest {
    std::string method{"GET"};                   ///< HTTP method
    std::string path;                            ///< Path and query, e.g. "/containers/create"
    std::string body;                            ///< Request body (sent only if non-empty)
    std::map<std::string, std::string> headers;  ///< Extra request headers
};

/**
 * @struct EngineResponse
 * @brief Engine API reply
 */
struct EngineResponse {
    int status{0};     ///< HTTP status code
    std::string body;  ///< Raw response body

    bool IsSuccess() const { return status >= 200 && status < 300; }
};

/**
 * @class EngineTransport
 * @brief Abstract request/response channel to the engine
 */
class EngineTransport {
public:
    virtual ~EngineTransport() = default;

    /**
     * @brief Perform one request
     * @throws core::ContainerRuntimeError if the engine could not be reached
     * @throws core::OperationCancelledError if the token fired
     */
    virtual EngineResponse Send(const EngineRequest& request,
                                const core::CancellationToken& token) = 0;
};

/**
 * @class CurlUnixSocketTransport
 * @brief EngineTransport backed by `curl --unix-socket`
 */
class CurlUnixSocketTransport : public EngineTransport {
public:
    /**
     * @param socket_path Engine socket (usually /var/run/docker.sock)
     * @param curl_binary curl executable name or path
     */
    explicit CurlUnixSocketTransport(std::string socket_path = "/var/run/docker.sock",
                                     std::string curl_binary = "curl");

    EngineResponse Send(const EngineRequest& request,
                        const core::CancellationToken& token) override;

    /// argv used for a request (exposed for diagnostics and tests)
    std::vector<std::string> BuildArgv(const EngineRequest& request) const;

    /**
     * @brief Split curl output into body and trailing status line
     * @param output stdout of curl, ending with "\n<status>"
     * @return Parsed response
     *
     * @throws core::ContainerRuntimeError if no status line is present
     */
    static EngineResponse ParseOutput(const std::string& output);

    const std::string& SocketPath() const { return socket_path_; }

private:
    std::string socket_path_;
    std::string curl_binary_;
};

} // namespace docker
} // namespace sandexec
