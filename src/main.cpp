/**
 * @file main.cpp
 * @brief scriptjail - Command-line interface
 *
 * Runs one script in the sandbox and mirrors its outcome: the script's stdout
 * and stderr are replayed on ours (or replaced by a JSON report with --json)
 * and the exit status is the script's. Diagnostics go to stderr.
 *
 * Credentials are taken from the invoking process' AWS_ACCESS_KEY_ID,
 * AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN and AWS_ACCOUNT_ID.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "scriptjail/core/sandbox_runner.hpp"
#include "scriptjail/reporters/json_reporter.hpp"
#include "scriptjail/utils/hash_utils.hpp"
#include "scriptjail/utils/string_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace {

// Exit status when the sandbox itself fails (provisioning, runtime, I/O)
constexpr int kSandboxFailureExit = 125;

std::string ReadScript(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open script: " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

std::string EnvOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? value : "";
}

scriptjail::core::CredentialSet CredentialsFromEnvironment() {
    scriptjail::core::CredentialSet credentials;
    credentials.access_key = EnvOrEmpty(scriptjail::core::kEnvAccessKeyId);
    credentials.secret_key = EnvOrEmpty(scriptjail::core::kEnvSecretAccessKey);
    credentials.session_token = EnvOrEmpty(scriptjail::core::kEnvSessionToken);
    credentials.account_id = EnvOrEmpty(scriptjail::core::kEnvAccountId);
    return credentials;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"scriptjail - run untrusted scripts with confined file access"};

    std::string script_path;
    std::string work_dir;
    std::vector<std::string> env_assignments;
    std::string backend_name;
    double timeout_seconds = 0;
    std::string config_path;
    std::string report_path;
    bool json_output = false;
    bool keep_script = false;
    bool verbose = false;

    app.add_option("script", script_path, "Script file to run ('-' reads standard input)")
        ->required();
    app.add_option("-w,--workdir", work_dir, "Work directory (created if missing)")
        ->required();
    app.add_option("-e,--env", env_assignments, "Extra variable for the script (KEY=VALUE)");
    app.add_option("--backend", backend_name, "Confinement backend")
        ->check(CLI::IsMember({"container", "interception"}));
    app.add_option("--timeout", timeout_seconds, "Kill the script after this many seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--report", report_path, "Write a JSON report to this file");
    app.add_flag("--json", json_output, "Print a JSON report instead of the script output");
    app.add_flag("--keep-script", keep_script, "Leave the script file in the work directory");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Logs on stderr; stdout belongs to the script
    spdlog::set_default_logger(spdlog::stderr_color_mt("scriptjail"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        using namespace scriptjail;

        // Configuration layers: defaults, file, environment, command line
        core::RunnerConfig config;
        if (!config_path.empty()) {
            config = core::RunnerConfig::FromJsonFile(config_path, config);
        }
        config = core::RunnerConfig::FromEnvironment(config);

        core::SandboxBuilder builder(config);
        if (!backend_name.empty()) {
            builder.WithBackend(*core::ParseBackendKind(backend_name));
        }
        if (timeout_seconds > 0) {
            builder.WithTimeout(std::chrono::milliseconds(static_cast<long long>(timeout_seconds * 1000.0)));
        }
        if (keep_script) {
            builder.KeepScriptFile();
        }

        core::ExecutionRequest request;
        request.script = ReadScript(script_path);
        request.work_directory = work_dir;
        request.credentials = CredentialsFromEnvironment();

        for (const auto& assignment : env_assignments) {
            auto pair = utils::StringUtils::ParseKeyValue(assignment);
            if (!pair) {
                spdlog::error("Invalid --env value '{}', expected KEY=VALUE", assignment);
                return 2;
            }
            request.extra_env[pair->first] = pair->second;
        }

        auto runner = builder.Build();
        auto result = runner.Run(request);

        reporters::ReportMetadata metadata;
        metadata.script_sha256 = utils::HashUtils::ComputeSHA256(request.script);
        metadata.work_directory = std::filesystem::absolute(work_dir);
        if (auto image = runner.Backend().Provision(); !image.id.empty()) {
            metadata.image = image.id;
        }

        reporters::JsonReporter reporter;
        if (!report_path.empty() && !reporter.SaveReport(result, report_path, metadata)) {
            spdlog::warn("Report could not be written to {}", report_path);
        }

        if (json_output) {
            std::cout << reporter.GenerateJsonString(result, metadata) << std::endl;
        } else {
            std::cout << result.stdout_output << std::flush;
            std::cerr << result.stderr_output << std::flush;
        }

        if (result.timed_out) {
            spdlog::error("Script timed out after {} ms", result.duration.count());
        }
        return result.exit_code;

    } catch (const scriptjail::core::SandboxError& e) {
        spdlog::error("{}", e.what());
        return kSandboxFailureExit;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return kSandboxFailureExit;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kSandboxFailureExit;
    }
}
