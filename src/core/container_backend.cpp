/**
 * @file container_backend.cpp
 * @brief Container lifecycle for one execution
 *
 * **Sequence**:
 * ```
 * create (mounts, --env-file) -> start -> wait [deadline -> kill] -> logs -> rm --force
 * ```
 *
 * The container runs as the calling user so files it writes into the work
 * and artifact directories belong to the caller on the host.
 *
 * @date 2025
 */

#include "scriptjail/core/container_backend.hpp"
#include "scriptjail/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace scriptjail {
namespace core {

namespace {

/**
 * @brief Force-removes a container when it goes out of scope
 */
class ContainerGuard {
public:
    ContainerGuard(const utils::ContainerUtils& docker, std::string container_id)
        : docker_(docker), container_id_(std::move(container_id)) {}

    ~ContainerGuard() {
        docker_.RemoveContainer(container_id_, true);
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    const utils::ContainerUtils& docker_;
    std::string container_id_;
};

} // anonymous namespace

ContainerBackend::ContainerBackend(RunnerConfig config,
                                   std::shared_ptr<ImageProvisioner> provisioner)
    : config_(std::move(config)),
      provisioner_(std::move(provisioner)),
      docker_(config_.docker_binary) {
    if (!provisioner_) {
        RunnerConfig build_config = config_;
        provisioner_ = ImageCache::Instance().Acquire(
            ImageCacheKey(config_),
            [build_config]() { return BuildContainerImage(build_config); });
    }
}

ExecutionImage ContainerBackend::Provision() {
    return provisioner_->EnsureImage();
}

std::filesystem::path ContainerBackend::SandboxWorkDirectory(const std::filesystem::path&) const {
    return config_.container_workdir;
}

utils::ContainerConfig ContainerBackend::BuildContainerConfig(const ExecutionImage& image,
                                                              const PreparedExecution& execution) const {
    utils::ContainerConfig container;
    container.name = "scriptjail_run_" + utils::StringUtils::RandomAlphanumeric(12);
    container.image = image.id;
    container.network_mode = config_.network_mode;
    container.user = std::to_string(::getuid()) + ":" + std::to_string(::getgid());
    container.working_dir = execution.sandbox_work_directory;
    container.labels["scriptjail.execution"] = "1";

    container.mounts.push_back({execution.host_work_directory, execution.sandbox_work_directory, false});
    if (execution.artifact_directory) {
        container.mounts.push_back({*execution.artifact_directory, *execution.artifact_directory, false});
    }

    // The composed environment travels in the env file. Defaults it does not
    // override and the confinement variables, which callers cannot override,
    // are written inline.
    container.environment_vars = execution.environment;
    container.environment_vars.erase(kPreloadEnvVar);
    container.environment_vars.erase(kPolicyEnvVar);

    const std::string workdir = execution.sandbox_work_directory.string();
    const std::map<std::string, std::string> defaults = {
        {"HOME", workdir},
        {"TMPDIR", workdir},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTHONUNBUFFERED", "1"},
    };
    for (const auto& [key, value] : defaults) {
        if (container.environment_vars.count(key) == 0) {
            container.inline_environment[key] = value;
        }
    }
    container.inline_environment[kPreloadEnvVar] = image.preload_library.string();
    container.inline_environment[kPolicyEnvVar] = execution.policy.Serialize();

    container.command = {image.interpreter, execution.script_filename};
    return container;
}

ExecutionResult ContainerBackend::Execute(const ExecutionImage& image,
                                          const PreparedExecution& execution) {
    auto container = BuildContainerConfig(image, execution);

    std::string container_id;
    try {
        container_id = docker_.CreateContainer(container);
    } catch (const std::exception& e) {
        throw InfrastructureError(e.what());
    }

    ContainerGuard guard(docker_, container_id);
    const auto start = std::chrono::steady_clock::now();

    ExecutionResult result;
    try {
        docker_.StartContainer(container_id);

        auto exit_code = docker_.WaitForContainer(container_id, execution.timeout);
        if (!exit_code) {
            docker_.KillContainer(container_id);
            result.timed_out = true;
            result.exit_code = kTimeoutExitCode;
        } else {
            result.exit_code = *exit_code;
        }
    } catch (const std::runtime_error& e) {
        throw InfrastructureError(e.what());
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    auto logs = docker_.GetContainerLogs(container_id);
    if (!logs.success) {
        throw InfrastructureError("cannot read output of container " + container_id.substr(0, 12) +
                                  ": " + utils::StringUtils::Trim(logs.stderr_output));
    }
    result.stdout_output = std::move(logs.stdout_output);
    result.stderr_output = std::move(logs.stderr_output);

    return result;
}

bool ContainerBackend::RetireImage() {
    auto image = provisioner_->Current();
    provisioner_->Invalidate();
    if (!image) {
        return false;
    }
    return docker_.RemoveImage(image->id, true);
}

} // namespace core
} // namespace scriptjail
