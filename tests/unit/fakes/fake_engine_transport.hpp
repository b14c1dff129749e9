/**
 * @file fake_engine_transport.hpp
 * @brief Route table EngineTransport for Docker client tests
 *
 * @date 2025
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sandexec/core/errors.hpp"
#include "sandexec/docker/engine_transport.hpp"

namespace sandexec {
namespace fakes {

class FakeEngineTransport : public docker::EngineTransport {
public:
    /// Reply for an exact "METHOD /path?query"
    void On(const std::string& method, const std::string& path, int status, std::string body = "") {
        routes_[method + " " + path] = docker::EngineResponse{status, std::move(body)};
    }

    /// Make every request fail as if the socket were unreachable
    std::optional<std::string> unreachable;

    docker::EngineResponse Send(const docker::EngineRequest& request,
                                const core::CancellationToken& token) override {
        requests.push_back(request);
        if (token.IsCancelled()) {
            throw core::OperationCancelledError("request cancelled",
                                                token.Reason() == core::CancelReason::DEADLINE_EXCEEDED);
        }
        if (unreachable) {
            throw core::ContainerRuntimeError(*unreachable);
        }
        auto it = routes_.find(request.method + " " + request.path);
        if (it == routes_.end()) {
            return docker::EngineResponse{404, R"({"message":"page not found"})"};
        }
        return it->second;
    }

    const docker::EngineRequest& Last() const { return requests.back(); }

    std::vector<docker::EngineRequest> requests;

private:
    std::map<std::string, docker::EngineResponse> routes_;
};

} // namespace fakes
} // namespace sandexec
