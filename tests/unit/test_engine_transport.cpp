#include <gtest/gtest.h>
#include "sandexec/core/errors.hpp"
#include "sandexec/docker/engine_transport.hpp"

#include <vector>

using sandexec::core::ContainerRuntimeError;
using sandexec::docker::CurlUnixSocketTransport;
using sandexec::docker::EngineRequest;

// ============================================================================
// BuildArgv Tests
// ============================================================================

TEST(EngineTransportTest, GetRequestHasNoBody) {
    CurlUnixSocketTransport transport("/run/docker.sock");
    EngineRequest request;
    request.path = "/_ping";

    std::vector<std::string> expected = {
        "curl", "--silent", "--show-error",
        "--unix-socket", "/run/docker.sock",
        "--request", "GET",
        "--write-out", "\n%{http_code}",
        "http://localhost/_ping"};
    EXPECT_EQ(transport.BuildArgv(request), expected);
}

TEST(EngineTransportTest, PostRequestReadsBodyFromStdin) {
    CurlUnixSocketTransport transport("/var/run/docker.sock", "/usr/bin/curl");
    EngineRequest request;
    request.method = "POST";
    request.path = "/containers/create";
    request.body = R"({"Image":"alpine:3.20"})";
    request.headers["X-Registry-Auth"] = "e30=";

    auto argv = transport.BuildArgv(request);

    EXPECT_EQ(argv.front(), "/usr/bin/curl");
    EXPECT_EQ(argv.back(), "http://localhost/containers/create");
    for (const auto& arg : argv) {
        EXPECT_EQ(arg.find("alpine"), std::string::npos) << "body leaked into argv";
    }

    std::vector<std::string> tail(argv.begin() + 7, argv.end());
    std::vector<std::string> expected_tail = {
        "--header", "X-Registry-Auth: e30=",
        "--header", "Content-Type: application/json",
        "--data-binary", "@-",
        "--write-out", "\n%{http_code}",
        "http://localhost/containers/create"};
    EXPECT_EQ(tail, expected_tail);
}

TEST(EngineTransportTest, DefaultSocketPath) {
    EXPECT_EQ(CurlUnixSocketTransport().SocketPath(), "/var/run/docker.sock");
}

// ============================================================================
// ParseOutput Tests
// ============================================================================

TEST(EngineTransportTest, ParseOutputSplitsStatusLine) {
    auto response = CurlUnixSocketTransport::ParseOutput("{\"Id\":\"abc\"}\n201");

    EXPECT_EQ(response.status, 201);
    EXPECT_EQ(response.body, "{\"Id\":\"abc\"}");
    EXPECT_TRUE(response.IsSuccess());
}

TEST(EngineTransportTest, ParseOutputKeepsBodyNewlines) {
    auto response = CurlUnixSocketTransport::ParseOutput("line 1\nline 2\n\n200");

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "line 1\nline 2\n");
}

TEST(EngineTransportTest, ParseOutputEmptyBody) {
    auto response = CurlUnixSocketTransport::ParseOutput("\n204");

    EXPECT_EQ(response.status, 204);
    EXPECT_TRUE(response.body.empty());
}

TEST(EngineTransportTest, ParseOutputRejectsGarbage) {
    EXPECT_THROW(CurlUnixSocketTransport::ParseOutput("no status"), ContainerRuntimeError);
    EXPECT_THROW(CurlUnixSocketTransport::ParseOutput("body\nabc"), ContainerRuntimeError);
    EXPECT_THROW(CurlUnixSocketTransport::ParseOutput("body\n20x"), ContainerRuntimeError);
}

TEST(EngineTransportTest, NonSuccessStatus) {
    EXPECT_FALSE(CurlUnixSocketTransport::ParseOutput("{}\n404").IsSuccess());
    EXPECT_FALSE(CurlUnixSocketTransport::ParseOutput("{}\n304").IsSuccess());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
