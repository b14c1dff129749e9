#include <gtest/gtest.h>
#include "sandexec/tools/sandbox_tool.hpp"
#include "sandexec/tools/tool_registry.hpp"
#include "fakes/fake_container_runtime.hpp"

#include <cctype>
#include <memory>
#include <stdexcept>

using namespace sandexec;
using fakes::FakeContainerRuntime;
using tools::ToolRegistry;
using json = nlohmann::json;

namespace {

class UppercaseTool : public tools::Tool {
public:
    std::string Name() const override { return "uppercase"; }
    std::string Description() const override { return "Uppercases text"; }
    json Definition() const override { return {{"type", "object"}}; }

    tools::ToolResult Call(const json& args, const core::CancellationToken&) override {
        std::string text = args.value("text", "");
        for (auto& c : text) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        tools::ToolResult result;
        result.data = text;
        return result;
    }
};

class ToolRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime = std::make_shared<FakeContainerRuntime>();
        auto executor = std::make_shared<core::SandboxExecutor>(runtime);
        registry.Register(std::make_shared<tools::SandboxTool>(executor));
        registry.Register(std::make_shared<UppercaseTool>());
    }

    json Dispatch(const std::string& payload) {
        return registry.Dispatch("docker_sandbox", payload, core::CancellationToken());
    }

    std::shared_ptr<FakeContainerRuntime> runtime;
    ToolRegistry registry;
};

} // anonymous namespace

// ============================================================================
// Registration Tests
// ============================================================================

TEST_F(ToolRegistryTest, RegisterAndLookup) {
    EXPECT_EQ(registry.Size(), 2u);
    EXPECT_TRUE(registry.Contains("docker_sandbox"));
    EXPECT_EQ(registry.Get("uppercase")->Description(), "Uppercases text");
    EXPECT_THROW(registry.Get("missing"), std::out_of_range);
}

TEST_F(ToolRegistryTest, RejectsDuplicateAndNull) {
    EXPECT_THROW(registry.Register(std::make_shared<UppercaseTool>()), std::invalid_argument);
    EXPECT_THROW(registry.Register(nullptr), std::invalid_argument);
}

TEST_F(ToolRegistryTest, DefinitionsAreOrderedByName) {
    auto definitions = registry.Definitions();

    ASSERT_EQ(definitions.size(), 2u);
    EXPECT_EQ(definitions[0]["name"], "docker_sandbox");
    EXPECT_EQ(definitions[1]["name"], "uppercase");
    EXPECT_EQ(definitions[0]["input_schema"]["type"], "object");

    auto listed = registry.List();
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[1]->Name(), "uppercase");
}

// ============================================================================
// Dispatch Tests
// ============================================================================

TEST_F(ToolRegistryTest, DispatchReturnsToolOutput) {
    runtime->logs = "42\n";

    auto reply = Dispatch(R"json({"language":"python","code":"print(42)"})json");

    ASSERT_FALSE(reply.contains("error")) << reply.dump();
    EXPECT_EQ(reply["data"], "42\n");
    EXPECT_EQ(reply["metadata"]["exit_code"], "0");
}

TEST_F(ToolRegistryTest, DispatchRoutesByName) {
    auto reply = registry.Dispatch("uppercase", R"({"text":"hi"})", core::CancellationToken());
    EXPECT_EQ(reply["data"], "HI");
}

TEST_F(ToolRegistryTest, MalformedJsonBecomesInputEnvelope) {
    auto reply = Dispatch("{not json");

    ASSERT_TRUE(reply.contains("error"));
    EXPECT_EQ(reply["error"]["kind"], "input");
    EXPECT_EQ(reply["error"]["code"], "malformed_payload");
    EXPECT_EQ(reply["error"]["stage"], "resolve");
    EXPECT_TRUE(runtime->Calls().empty());
}

TEST_F(ToolRegistryTest, UnknownToolBecomesInputEnvelope) {
    auto reply = registry.Dispatch("shell", "{}", core::CancellationToken());

    EXPECT_EQ(reply["error"]["kind"], "input");
    EXPECT_NE(reply["error"]["message"].get<std::string>().find("unknown tool"), std::string::npos);
}

TEST_F(ToolRegistryTest, UnsupportedLanguageBecomesInputEnvelope) {
    auto reply = Dispatch(R"({"language":"cobol","code":"DISPLAY 'HI'."})");

    EXPECT_EQ(reply["error"]["kind"], "input");
    EXPECT_EQ(reply["error"]["code"], "schema_violation");
    EXPECT_TRUE(runtime->Calls().empty());
}

TEST_F(ToolRegistryTest, StartFailureBecomesInfrastructureEnvelope) {
    runtime->fail_start = "OCI runtime create failed";

    auto reply = Dispatch(R"json({"language":"python","code":"print(1)"})json");

    EXPECT_EQ(reply["error"]["kind"], "infrastructure");
    EXPECT_EQ(reply["error"]["stage"], "start");
    EXPECT_EQ(reply["error"]["cancelled"], false);
    EXPECT_EQ(reply["error"]["partial_output"], "");
    EXPECT_EQ(runtime->CallCount("RemoveContainer"), 1);
}

TEST_F(ToolRegistryTest, TimeoutEnvelopeCarriesPartialOutput) {
    runtime->block_wait = true;
    runtime->logs = "tick\n";

    auto reply = Dispatch(R"({"language":"bash","code":"sleep 30","timeout":1})");

    EXPECT_EQ(reply["error"]["kind"], "infrastructure");
    EXPECT_EQ(reply["error"]["stage"], "wait");
    EXPECT_EQ(reply["error"]["cancelled"], true);
    EXPECT_EQ(reply["error"]["partial_output"], "tick\n");
}

TEST_F(ToolRegistryTest, GenericExceptionEnvelope) {
    auto envelope = tools::ErrorEnvelope(std::runtime_error("boom"));

    EXPECT_EQ(envelope["error"]["kind"], "infrastructure");
    EXPECT_EQ(envelope["error"]["message"], "boom");
    EXPECT_FALSE(envelope["error"].contains("stage"));
}

TEST_F(ToolRegistryTest, CleanupEnvelopeNamesContainer) {
    auto envelope = tools::ErrorEnvelope(core::CleanupError("abc123", "remove failed"));

    EXPECT_EQ(envelope["error"]["kind"], "cleanup");
    EXPECT_EQ(envelope["error"]["stage"], "remove");
    EXPECT_EQ(envelope["error"]["container_id"], "abc123");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
