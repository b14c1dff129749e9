/**
 * @file main.cpp
 * @brief sandexec - Command-line interface
 *
 * Entry point for the sandboxed code execution engine. Runs guest programs
 * in disposable hardened Docker containers and prints the JSON tool reply.
 *
 * ```
 * sandexec run -l python -c "print(42)"
 * sandexec run --payload '{"language":"bash","code":"echo hi"}'
 * sandexec schema
 * sandexec check
 * sandexec selftest
 * ```
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "sandexec/config/settings.hpp"
#include "sandexec/core/cancellation.hpp"
#include "sandexec/core/sandbox_executor.hpp"
#include "sandexec/docker/docker_runtime.hpp"
#include "sandexec/docker/engine_client.hpp"
#include "sandexec/docker/engine_transport.hpp"
#include "sandexec/tools/sandbox_tool.hpp"
#include "sandexec/tools/tool_registry.hpp"
#include "sandexec/utils/process_utils.hpp"
#include "sandexec/utils/string_utils.hpp"

#include <csignal>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <thread>

#include <pthread.h>

using json = nlohmann::json;
using namespace sandexec;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitInputError = 1;
constexpr int kExitInfrastructureError = 2;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║   sandexec - disposable sandboxes for untrusted code          ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

int ExitCodeFor(const json& reply) {
    if (!reply.contains("error")) {
        return kExitOk;
    }
    return reply["error"].value("kind", "") == "input" ? kExitInputError
                                                      : kExitInfrastructureError;
}

void PrintReply(const json& reply, bool output_only) {
    if (!output_only) {
        std::cout << reply.dump(2) << std::endl;
        return;
    }
    if (reply.contains("error")) {
        std::cerr << reply["error"].value("message", "") << std::endl;
        const std::string partial = reply["error"].value("partial_output", "");
        std::cout << partial;
        return;
    }
    std::cout << reply.value("data", "");
}

/*******************************************************************************
 * Engine Wiring
 ******************************************************************************/

struct Engine {
    std::shared_ptr<docker::DockerEngineClient> client;
    std::shared_ptr<core::SandboxExecutor> executor;
    tools::ToolRegistry registry;
};

std::unique_ptr<Engine> BuildEngine(const config::Settings& settings) {
    auto engine = std::make_unique<Engine>();

    auto transport = std::make_shared<docker::CurlUnixSocketTransport>(
        settings.docker_socket, settings.curl_binary);
    engine->client = std::make_shared<docker::DockerEngineClient>(transport, settings.api_version);

    auto runtime = std::make_shared<docker::DockerContainerRuntime>(engine->client);
    engine->executor = std::make_shared<core::SandboxExecutor>(runtime, settings.ToExecutorConfig());

    engine->registry.Register(
        std::make_shared<tools::SandboxTool>(engine->executor, settings.max_timeout_seconds));

    return engine;
}

/**
 * Block SIGINT/SIGTERM in every thread and cancel the source from a
 * dedicated sigwait thread, so an interrupted run still removes its container.
 */
void InstallInterruptHandler(core::CancellationSource& source) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::thread([signals, source]() mutable {
        int received = 0;
        if (sigwait(&signals, &received) == 0) {
            spdlog::warn("Received signal {}, cancelling execution...", received);
            source.Cancel();
        }
    }).detach();
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

int RunCheck(Engine& engine, const config::Settings& settings) {
    PrintBanner();

    core::CancellationSource source = core::CancellationSource::WithTimeout(std::chrono::seconds(10));
    bool healthy = true;

    if (utils::ProcessRunner::IsExecutableAvailable(settings.curl_binary)) {
        spdlog::info("✓ curl available: {}", settings.curl_binary);
    } else {
        spdlog::error("curl not found: {}", settings.curl_binary);
        return kExitInfrastructureError;
    }

    try {
        if (!engine.client->Ping(source.Token())) {
            spdlog::error("Docker engine not reachable at {}", settings.docker_socket);
            return kExitInfrastructureError;
        }
        spdlog::info("✓ Docker engine reachable at {}", settings.docker_socket);
        spdlog::info("✓ Engine version: {}", engine.client->Version(source.Token()));

        for (const auto& profile : engine.executor->Catalog().Profiles()) {
            bool present = engine.client->ImageExists(profile.image, source.Token());
            if (present) {
                spdlog::info("✓ {} image present: {}", profile.id, profile.image);
            } else {
                spdlog::warn("⚠ {} image not pulled yet: {} (pulled on first use)",
                             profile.id, profile.image);
            }
        }
    } catch (const core::ContainerRuntimeError& e) {
        spdlog::error("Engine check failed: {}", e.what());
        healthy = false;
    }

    return healthy ? kExitOk : kExitInfrastructureError;
}

struct SelfTestCase {
    std::string title;
    json payload;
    std::function<bool(const json&)> expectation;
};

bool HasExitCode(const json& reply, const std::string& code) {
    return reply.contains("metadata") && reply["metadata"].value("exit_code", "") == code;
}

bool OutputContains(const json& reply, const std::string& text) {
    return utils::StringUtils::Contains(reply.value("data", ""), text);
}

bool FailedAt(const json& reply, const std::string& kind, const std::string& stage) {
    return reply.contains("error") &&
           reply["error"].value("kind", "") == kind &&
           (stage.empty() || reply["error"].value("stage", "") == stage);
}

int RunSelfTest(Engine& engine, const core::CancellationToken& token) {
    PrintBanner();
    std::cout << "=== Docker Sandbox Integration Test ===" << std::endl;
    std::cout << "Requires: Docker daemon running" << std::endl;

    if (!engine.client->Ping(token)) {
        std::cerr << "FAIL: Cannot connect to Docker" << std::endl;
        return kExitInfrastructureError;
    }
    std::cout << "[OK] Connected to Docker daemon" << std::endl;

    const std::vector<SelfTestCase> cases = {
        {"Python execution",
         {{"language", "python"}, {"code", "print('Hello from sandbox!')"}},
         [](const json& r) { return HasExitCode(r, "0") && OutputContains(r, "Hello from sandbox!"); }},
        {"Bash execution",
         {{"language", "bash"}, {"code", "echo 'Hello from Alpine!' && whoami && hostname"}},
         [](const json& r) { return HasExitCode(r, "0") && OutputContains(r, "Hello from Alpine!"); }},
        {"JavaScript execution",
         {{"language", "javascript"}, {"code", "console.log('Hello from Node.js!'); console.log(process.version)"}},
         [](const json& r) { return HasExitCode(r, "0") && OutputContains(r, "Hello from Node.js!"); }},
        {"Non-zero exit (Python error)",
         {{"language", "python"}, {"code", "raise ValueError('intentional error')"}},
         [](const json& r) { return HasExitCode(r, "1") && OutputContains(r, "ValueError"); }},
        {"Network isolation",
         {{"language", "bash"}, {"code", "wget -T 3 http://example.com 2>&1 || echo 'GOOD: Network is blocked'"}},
         [](const json& r) { return OutputContains(r, "GOOD: Network is blocked"); }},
        {"Read-only root filesystem",
         {{"language", "bash"}, {"code", "touch /probe 2>/dev/null || echo 'GOOD: rootfs is read-only'"}},
         [](const json& r) { return OutputContains(r, "GOOD: rootfs is read-only"); }},
        {"Multiline Python",
         {{"language", "python"}, {"code", "import sys\nfor i in range(5):\n    print(f'Line {i}')\nprint(f'Python {sys.version}')\n"}},
         [](const json& r) { return HasExitCode(r, "0") && OutputContains(r, "Line 4"); }},
        {"Custom timeout",
         {{"language", "bash"}, {"code", "echo 'fast'"}, {"timeout", 5}},
         [](const json& r) { return HasExitCode(r, "0") && OutputContains(r, "fast"); }},
        {"Timeout enforcement",
         {{"language", "bash"}, {"code", "sleep 30"}, {"timeout", 2}},
         [](const json& r) { return FailedAt(r, "infrastructure", "wait"); }},
        {"Input validation (should reject)",
         {{"language", "cobol"}, {"code", "DISPLAY 'HI'"}},
         [](const json& r) { return FailedAt(r, "input", ""); }},
    };

    int failures = 0;
    int index = 1;
    for (const auto& test : cases) {
        if (token.IsCancelled()) {
            std::cout << "\nInterrupted" << std::endl;
            return kExitInfrastructureError;
        }

        std::cout << "\n--- Test " << index++ << ": " << test.title << " ---" << std::endl;
        json reply = engine.registry.Dispatch(tools::SandboxTool::kName, test.payload.dump(), token);

        if (reply.contains("error")) {
            std::cout << "  Error: " << reply["error"].value("message", "") << std::endl;
        } else {
            std::cout << "  Output: " << utils::StringUtils::Trim(reply.value("data", "")) << std::endl;
            std::cout << "  Metadata: language=" << reply["metadata"].value("language", "")
                      << " image=" << reply["metadata"].value("image", "")
                      << " exit_code=" << reply["metadata"].value("exit_code", "") << std::endl;
        }

        bool passed = test.expectation(reply);
        std::cout << (passed ? "  [PASS]" : "  [FAIL]") << std::endl;
        if (!passed) {
            ++failures;
        }
    }

    std::cout << "\n=== Integration Test Complete: "
              << (cases.size() - failures) << "/" << cases.size() << " passed ===" << std::endl;
    return failures == 0 ? kExitOk : kExitInfrastructureError;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"sandexec - run untrusted code in disposable hardened containers"};
    app.require_subcommand(1);

    std::string config_path;
    std::string socket_override;
    std::string log_level_override;
    bool verbose = false;

    app.add_option("--config", config_path, "JSON settings file")
        ->check(CLI::ExistingFile);
    app.add_option("--socket", socket_override, "Docker engine socket");
    app.add_option("--log-level", log_level_override, "trace, debug, info, warn, error, critical, off");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // run
    auto* run = app.add_subcommand("run", "Execute a code snippet in a sandbox");
    std::string language;
    std::string code;
    std::string code_file;
    std::string payload;
    int timeout = 0;
    bool output_only = false;

    auto* language_opt = run->add_option("-l,--language", language, "Language (python, bash, javascript)");
    auto* code_opt = run->add_option("-c,--code", code, "Source code");
    auto* file_opt = run->add_option("-f,--file", code_file, "Read source code from file")
        ->check(CLI::ExistingFile);
    auto* timeout_opt = run->add_option("-t,--timeout", timeout, "Timeout in seconds");
    auto* payload_opt = run->add_option("--payload", payload, "Raw JSON tool payload");
    run->add_flag("--output-only", output_only, "Print only the program output");

    code_opt->excludes(file_opt);
    payload_opt->excludes(language_opt)->excludes(code_opt)->excludes(file_opt)->excludes(timeout_opt);

    auto* schema = app.add_subcommand("schema", "Print tool definitions as JSON");
    auto* check = app.add_subcommand("check", "Verify the Docker engine is reachable");
    auto* selftest = app.add_subcommand("selftest", "Run integration scenarios against the engine");

    CLI11_PARSE(app, argc, argv);

    // Logs go to stderr; stdout carries the JSON reply
    spdlog::set_default_logger(spdlog::stderr_color_mt("sandexec"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    config::Settings settings;
    try {
        if (!config_path.empty()) {
            settings = config::Settings::LoadFromFile(config_path);
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return kExitInputError;
    }

    if (!socket_override.empty()) {
        settings.docker_socket = socket_override;
    }
    if (!log_level_override.empty()) {
        settings.log_level = utils::StringUtils::ToLower(log_level_override);
    }
    if (verbose) {
        settings.log_level = "debug";
    }

    auto problems = settings.Validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            spdlog::error("Invalid settings: {}", problem);
        }
        return kExitInputError;
    }
    spdlog::set_level(spdlog::level::from_str(settings.log_level));
    spdlog::debug("Settings: {}", settings.ToJson().dump());

    core::CancellationSource interrupt;
    InstallInterruptHandler(interrupt);

    try {
        auto engine = BuildEngine(settings);

        if (*schema) {
            std::cout << engine->registry.Definitions().dump(2) << std::endl;
            return kExitOk;
        }

        if (*check) {
            return RunCheck(*engine, settings);
        }

        if (*selftest) {
            return RunSelfTest(*engine, interrupt.Token());
        }

        // run
        if (payload.empty()) {
            if (language.empty()) {
                spdlog::error("run: --language is required unless --payload is given");
                return kExitInputError;
            }
            if (!code_file.empty()) {
                std::ifstream file(code_file, std::ios::binary);
                std::ostringstream buffer;
                buffer << file.rdbuf();
                code = buffer.str();
            }

            json args = {{"language", language}, {"code", code}};
            if (*timeout_opt) {
                args["timeout"] = timeout;
            }
            payload = args.dump();
        }

        json reply = engine->registry.Dispatch(tools::SandboxTool::kName, payload, interrupt.Token());
        PrintReply(reply, output_only);
        return ExitCodeFor(reply);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitInfrastructureError;
    }
}
