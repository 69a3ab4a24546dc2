/**
 * @file sandbox_runner.cpp
 * @brief Orchestration of one sandboxed execution
 *
 * @date 2025
 */

#include "scriptjail/core/sandbox_runner.hpp"
#include "scriptjail/core/container_backend.hpp"
#include "scriptjail/core/interception_backend.hpp"
#include "scriptjail/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace scriptjail {
namespace core {

namespace fs = std::filesystem;

namespace {

/**
 * @brief Deletes the script file when the execution is over
 */
class ScriptFileGuard {
public:
    ScriptFileGuard(fs::path path, bool enabled)
        : path_(std::move(path)), enabled_(enabled) {}

    ~ScriptFileGuard() {
        if (!enabled_) {
            return;
        }
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove script file {}: {}", path_.string(), ec.message());
        }
    }

    ScriptFileGuard(const ScriptFileGuard&) = delete;
    ScriptFileGuard& operator=(const ScriptFileGuard&) = delete;

private:
    fs::path path_;
    bool enabled_;
};

fs::path PrepareDirectory(const fs::path& dir, const char* what) {
    if (dir.empty()) {
        throw InfrastructureError(std::string(what) + " is empty");
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw InfrastructureError(std::string("cannot create ") + what + " " + dir.string() +
                                  ": " + ec.message());
    }
    auto canonical = fs::canonical(dir, ec);
    if (ec) {
        throw InfrastructureError(std::string("cannot resolve ") + what + " " + dir.string() +
                                  ": " + ec.message());
    }
    if (!fs::is_directory(canonical)) {
        throw InfrastructureError(std::string(what) + " is not a directory: " + canonical.string());
    }
    return canonical;
}

void WriteScript(const fs::path& path, const std::string& script) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw InfrastructureError("cannot write script file " + path.string());
    }
    out.write(script.data(), static_cast<std::streamsize>(script.size()));
    out.close();
    if (!out) {
        throw InfrastructureError("failed writing script file " + path.string());
    }
}

std::string FormatEnvironment(const EnvironmentMap& env) {
    std::vector<std::string> entries;
    for (const auto& [key, value] : EnvironmentInjector::RedactForLog(env)) {
        entries.push_back(key + "=" + value);
    }
    return utils::StringUtils::Join(entries, " ");
}

} // anonymous namespace

// ============================================================================
// POLICY COMPOSITION
// ============================================================================

const std::vector<fs::path>& SystemReadOnlyPaths() {
    static const std::vector<fs::path> paths = {
        "/dev/urandom",
        "/dev/random",
        "/etc/ssl",
        "/etc/ca-certificates",
        "/etc/pki",
        "/usr/share/ca-certificates",
        "/usr/share/zoneinfo",
        "/etc/localtime",
        "/etc/timezone",
        "/etc/resolv.conf",
        "/etc/hosts",
        "/etc/nsswitch.conf",
        "/etc/gai.conf",
        "/etc/mime.types",
    };
    return paths;
}

ConfinementPolicy ComposePolicy(const fs::path& sandbox_work_dir,
                                const std::optional<fs::path>& artifact_dir,
                                const std::vector<fs::path>& read_only_paths) {
    ConfinementPolicy policy;

    policy.Allow(sandbox_work_dir, AccessMode::READ_WRITE);
    if (artifact_dir) {
        policy.Allow(*artifact_dir, AccessMode::READ_WRITE);
    }

    policy.Allow("/dev/null", AccessMode::READ_WRITE);
    for (const auto& path : SystemReadOnlyPaths()) {
        policy.Allow(path, AccessMode::READ_ONLY);
    }
    for (const auto& path : read_only_paths) {
        policy.Allow(path, AccessMode::READ_ONLY);
    }

    return policy;
}

// ============================================================================
// BACKEND FACTORY
// ============================================================================

std::shared_ptr<SandboxBackend> CreateBackend(const RunnerConfig& config) {
    switch (config.backend) {
        case BackendKind::CONTAINER:
            return std::make_shared<ContainerBackend>(config);
        case BackendKind::INTERCEPTION:
            return std::make_shared<InterceptionBackend>(config);
    }
    throw std::invalid_argument("unknown backend");
}

// ============================================================================
// SANDBOX RUNNER
// ============================================================================

SandboxRunner::SandboxRunner(RunnerConfig config)
    : SandboxRunner(config,
                    CreateBackend(config),
                    EnvironmentInjector(EnvironmentInjector::CaptureHostEnvironment(
                                            config.artifact_dir_variable),
                                        config.default_region,
                                        config.artifact_dir_variable)) {}

SandboxRunner::SandboxRunner(RunnerConfig config,
                             std::shared_ptr<SandboxBackend> backend,
                             EnvironmentInjector injector)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      injector_(std::move(injector)) {
    if (!backend_) {
        throw std::invalid_argument("SandboxRunner requires a backend");
    }
    config_.Validate();
}

ExecutionResult SandboxRunner::Run(const ExecutionRequest& request) {
    const fs::path work_dir = PrepareDirectory(request.work_directory, "work directory");
    const fs::path script_path = work_dir / config_.script_filename;

    spdlog::info("Running script ({} bytes) with {} backend in {}",
                 request.script.size(), backend_->Name(), work_dir.string());

    WriteScript(script_path, request.script);
    ScriptFileGuard script_guard(script_path, config_.remove_script_after_run);

    ExecutionImage image = backend_->Provision();
    PreparedExecution execution = Prepare(request, image, work_dir);

    spdlog::debug("Environment: {}", FormatEnvironment(execution.environment));
    spdlog::debug("Policy: {} rules", execution.policy.Rules().size());

    ExecutionResult result = backend_->Execute(image, execution);
    result.backend = backend_->Name();

    if (result.timed_out) {
        spdlog::warn("Script killed after {} ms", result.duration.count());
    } else if (result.exit_code != 0) {
        spdlog::info("Script exited with code {} after {} ms", result.exit_code,
                     result.duration.count());
    } else {
        spdlog::info("Script completed in {} ms", result.duration.count());
    }

    return result;
}

ExecutionResult SandboxRunner::RunChecked(const ExecutionRequest& request) {
    ExecutionResult result = Run(request);
    if (!result.Succeeded()) {
        throw ScriptFailedError(std::move(result));
    }
    return result;
}

PreparedExecution SandboxRunner::Prepare(const ExecutionRequest& request,
                                         const ExecutionImage& image,
                                         const fs::path& work_dir) const {
    PreparedExecution execution;
    execution.host_work_directory = work_dir;
    execution.sandbox_work_directory = backend_->SandboxWorkDirectory(work_dir);
    execution.script_filename = config_.script_filename;
    execution.timeout = config_.timeout;

    if (auto artifact_dir = injector_.ExternalArtifactDirectory()) {
        execution.artifact_directory = PrepareDirectory(*artifact_dir, "artifact directory");
    }

    execution.environment = injector_.Compose(request.credentials, request.extra_env,
                                              execution.sandbox_work_directory);
    // The artifact directory is mounted at its canonical path; advertise that
    // path unless the caller overrode the variable
    if (execution.artifact_directory &&
        request.extra_env.count(injector_.ArtifactVariable()) == 0) {
        execution.environment[injector_.ArtifactVariable()] = execution.artifact_directory->string();
    }

    std::vector<fs::path> read_only = image.runtime_paths;
    read_only.insert(read_only.end(), config_.extra_read_only_paths.begin(),
                     config_.extra_read_only_paths.end());
    execution.policy = ComposePolicy(execution.sandbox_work_directory,
                                     execution.artifact_directory, read_only);

    return execution;
}

// ============================================================================
// SANDBOX BUILDER
// ============================================================================

SandboxBuilder& SandboxBuilder::WithBackend(BackendKind backend) {
    config_.backend = backend;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithTimeout(std::chrono::milliseconds timeout) {
    config_.timeout = timeout;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithoutTimeout() {
    config_.timeout.reset();
    return *this;
}

SandboxBuilder& SandboxBuilder::WithScriptFilename(const std::string& filename) {
    config_.script_filename = filename;
    return *this;
}

SandboxBuilder& SandboxBuilder::KeepScriptFile(bool keep) {
    config_.remove_script_after_run = !keep;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithBuildContext(const fs::path& dir) {
    config_.build_context_dir = dir;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithImagePrefix(const std::string& prefix) {
    config_.image_prefix = prefix;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithDockerBinary(const std::string& binary) {
    config_.docker_binary = binary;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithNetwork(utils::NetworkMode mode) {
    config_.network_mode = mode;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithInterpreter(const std::string& interpreter) {
    config_.interpreter = interpreter;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithPreloadLibrary(const fs::path& library) {
    config_.preload_library = library;
    return *this;
}

SandboxBuilder& SandboxBuilder::AddReadOnlyPath(const fs::path& path) {
    config_.extra_read_only_paths.push_back(path);
    return *this;
}

SandboxBuilder& SandboxBuilder::WithDefaultRegion(const std::string& region) {
    config_.default_region = region;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithArtifactVariable(const std::string& name) {
    config_.artifact_dir_variable = name;
    return *this;
}

RunnerConfig SandboxBuilder::BuildConfig() const {
    config_.Validate();
    return config_;
}

SandboxRunner SandboxBuilder::Build() const {
    return SandboxRunner(BuildConfig());
}

} // namespace core
} // namespace scriptjail
