/**
 * @file sandbox_runner.hpp
 * @brief One-shot confined script execution
 *
 * SandboxRunner orchestrates a single execution and delegates the confined
 * part to a SandboxBackend:
 *
 * ```
 * Run(request)
 *   1. create/canonicalize the work directory, write the script file
 *   2. backend.Provision()              -> ExecutionImage (memoized)
 *   3. EnvironmentInjector::Compose()   -> environment
 *   4. ComposePolicy()                  -> ConfinementPolicy
 *   5. backend.Execute()                -> ExecutionResult (blocks)
 *   6. remove the script file
 * ```
 *
 * Non-zero exit codes and policy violations are data in the result. Only
 * ProvisioningError and InfrastructureError leave Run(); backends tear down
 * their container or child process before an error surfaces.
 *
 * @date 2025
 */

#pragma once

#include "scriptjail/core/execution_types.hpp"
#include "scriptjail/core/confinement_policy.hpp"
#include "scriptjail/core/environment_injector.hpp"
#include "scriptjail/core/image_provisioner.hpp"
#include "scriptjail/core/runner_config.hpp"

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>
#include <chrono>

namespace scriptjail {
namespace core {

/// Interceptor shim variable, always set by the backends
constexpr const char* kPreloadEnvVar = "LD_PRELOAD";

/**
 * @struct PreparedExecution
 * @brief Everything a backend needs for one execution
 */
struct PreparedExecution {
    std::filesystem::path host_work_directory;            ///< Canonical host path
    std::filesystem::path sandbox_work_directory;         ///< Same directory as the script sees it
    std::string script_filename;                          ///< Script file inside the work dir
    std::optional<std::filesystem::path> artifact_directory;  ///< Shared at an identical path
    EnvironmentMap environment;                           ///< Composed variables
    ConfinementPolicy policy;                             ///< Policy enforced inside the sandbox
    std::optional<std::chrono::milliseconds> timeout;     ///< Unset: wait for exit
};

/**
 * @class SandboxBackend
 * @brief Confinement strategy behind SandboxRunner
 */
class SandboxBackend {
public:
    virtual ~SandboxBackend() = default;

    /// Short name recorded in ExecutionResult::backend
    virtual std::string Name() const = 0;

    /**
     * @brief Make sure the execution environment exists
     * @throws ProvisioningError
     */
    virtual ExecutionImage Provision() = 0;

    /// Path of the host work directory as the script sees it
    virtual std::filesystem::path SandboxWorkDirectory(
        const std::filesystem::path& host_work_dir) const = 0;

    /**
     * @brief Run the script and wait for it
     *
     * Must release every resource it created (container, child process) on
     * all exit paths, including the deadline.
     *
     * @throws InfrastructureError if the execution cannot be started
     */
    virtual ExecutionResult Execute(const ExecutionImage& image,
                                    const PreparedExecution& execution) = 0;
};

/**
 * @brief Confinement policy for one execution
 *
 * Rule order: work directory (rw), artifact directory (rw), a few device
 * and system files the interpreter needs, then the read-only runtime paths.
 */
ConfinementPolicy ComposePolicy(const std::filesystem::path& sandbox_work_dir,
                                const std::optional<std::filesystem::path>& artifact_dir,
                                const std::vector<std::filesystem::path>& read_only_paths);

/// System files allowed in every policy (certificates, time zones, resolver)
const std::vector<std::filesystem::path>& SystemReadOnlyPaths();

/// Backend for config.backend
std::shared_ptr<SandboxBackend> CreateBackend(const RunnerConfig& config);

/**
 * @class SandboxRunner
 * @brief Runs untrusted scripts one request at a time
 *
 * Concurrent Run() calls are independent as long as their work directories
 * differ; they share only the memoized image.
 *
 * **Usage Example**:
 * @code
 * SandboxRunner runner(RunnerConfig{});
 *
 * ExecutionRequest request;
 * request.script = "print('hello')";
 * request.work_directory = "/tmp/job-1";
 *
 * auto result = runner.Run(request);
 * // result.exit_code == 0, result.stdout_output == "hello\n"
 * @endcode
 */
class SandboxRunner {
public:
    /// Backend from CreateBackend(), injector from the host environment
    explicit SandboxRunner(RunnerConfig config);

    SandboxRunner(RunnerConfig config,
                  std::shared_ptr<SandboxBackend> backend,
                  EnvironmentInjector injector);

    /**
     * @brief Execute one request
     * @return Captured output and exit status; non-zero exits are not raised
     * @throws ProvisioningError if the execution image cannot be built
     * @throws InfrastructureError if the work directory or backend fails
     */
    ExecutionResult Run(const ExecutionRequest& request);

    /**
     * @brief Run() that raises on a non-zero exit or timeout
     * @throws ScriptFailedError carrying the result
     */
    ExecutionResult RunChecked(const ExecutionRequest& request);

    const RunnerConfig& Config() const { return config_; }
    SandboxBackend& Backend() { return *backend_; }

private:
    RunnerConfig config_;
    std::shared_ptr<SandboxBackend> backend_;
    EnvironmentInjector injector_;

    PreparedExecution Prepare(const ExecutionRequest& request,
                              const ExecutionImage& image,
                              const std::filesystem::path& work_dir) const;
};

/**
 * @class SandboxBuilder
 * @brief Fluent API for configuring a SandboxRunner
 */
class SandboxBuilder {
public:
    SandboxBuilder() = default;
    explicit SandboxBuilder(RunnerConfig base) : config_(std::move(base)) {}

    SandboxBuilder& WithBackend(BackendKind backend);
    SandboxBuilder& WithTimeout(std::chrono::milliseconds timeout);
    SandboxBuilder& WithoutTimeout();
    SandboxBuilder& WithScriptFilename(const std::string& filename);
    SandboxBuilder& KeepScriptFile(bool keep = true);
    SandboxBuilder& WithBuildContext(const std::filesystem::path& dir);
    SandboxBuilder& WithImagePrefix(const std::string& prefix);
    SandboxBuilder& WithDockerBinary(const std::string& binary);
    SandboxBuilder& WithNetwork(utils::NetworkMode mode);
    SandboxBuilder& WithInterpreter(const std::string& interpreter);
    SandboxBuilder& WithPreloadLibrary(const std::filesystem::path& library);
    SandboxBuilder& AddReadOnlyPath(const std::filesystem::path& path);
    SandboxBuilder& WithDefaultRegion(const std::string& region);
    SandboxBuilder& WithArtifactVariable(const std::string& name);

    /// @throws std::invalid_argument if the configuration is unusable
    RunnerConfig BuildConfig() const;

    /// @throws std::invalid_argument if the configuration is unusable
    SandboxRunner Build() const;

private:
    RunnerConfig config_;
};

} // namespace core
} // namespace scriptjail
