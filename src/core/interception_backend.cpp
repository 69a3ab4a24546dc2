/**
 * @file interception_backend.cpp
 * @brief Confined host child process execution
 *
 * @date 2025
 */

#include "scriptjail/core/interception_backend.hpp"
#include "scriptjail/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace scriptjail {
namespace core {

InterceptionBackend::InterceptionBackend(RunnerConfig config,
                                         std::shared_ptr<ImageProvisioner> provisioner)
    : config_(std::move(config)),
      provisioner_(std::move(provisioner)) {
    if (!provisioner_) {
        RunnerConfig build_config = config_;
        provisioner_ = ImageCache::Instance().Acquire(
            ImageCacheKey(config_),
            [build_config]() { return ProbeHostInterpreter(build_config); });
    }
}

ExecutionImage InterceptionBackend::Provision() {
    return provisioner_->EnsureImage();
}

std::filesystem::path InterceptionBackend::SandboxWorkDirectory(
    const std::filesystem::path& host_work_dir) const {
    return host_work_dir;
}

EnvironmentMap InterceptionBackend::BaseEnvironment(const std::filesystem::path& work_dir) {
    EnvironmentMap env;
    const auto host = utils::CurrentEnvironment();

    auto path = host.find("PATH");
    env["PATH"] = path != host.end() ? path->second : "/usr/local/bin:/usr/bin:/bin";

    for (const char* name : {"LANG", "LC_ALL", "TZ"}) {
        auto it = host.find(name);
        if (it != host.end()) {
            env[name] = it->second;
        }
    }

    env["HOME"] = work_dir.string();
    env["TMPDIR"] = work_dir.string();
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    return env;
}

EnvironmentMap InterceptionBackend::ChildEnvironment(const ExecutionImage& image,
                                                     const PreparedExecution& execution) {
    EnvironmentMap env = BaseEnvironment(execution.host_work_directory);
    for (const auto& [key, value] : execution.environment) {
        env[key] = value;
    }

    // Confinement variables cannot be overridden by the request
    env[kPreloadEnvVar] = image.preload_library.string();
    env[kPolicyEnvVar] = execution.policy.Serialize();
    return env;
}

ExecutionResult InterceptionBackend::Execute(const ExecutionImage& image,
                                             const PreparedExecution& execution) {
    utils::ProcessOptions options;
    options.argv = {image.interpreter, execution.script_filename};
    options.env = ChildEnvironment(image, execution);
    options.working_dir = execution.host_work_directory;
    options.timeout = execution.timeout;

    utils::ProcessResult process;
    try {
        process = utils::RunProcess(options);
    } catch (const std::system_error& e) {
        throw InfrastructureError(std::string("cannot start interpreter: ") + e.what());
    }

    ExecutionResult result;
    result.stdout_output = std::move(process.stdout_output);
    result.stderr_output = std::move(process.stderr_output);
    result.duration = process.duration;
    result.timed_out = process.timed_out;
    result.exit_code = process.timed_out ? kTimeoutExitCode : process.exit_code;

    spdlog::debug("Interpreter child finished: exit {}, {} bytes stdout, {} bytes stderr",
                  result.exit_code, result.stdout_output.size(), result.stderr_output.size());
    return result;
}

} // namespace core
} // namespace scriptjail
