/**
 * @file interception_backend.hpp
 * @brief Alternative backend: host interpreter under the open interceptor
 *
 * The script runs as a child of the host interpreter with the open
 * interceptor preloaded. Every open() of the child and its descendants is
 * checked against the serialized policy: read-only below the interpreter's
 * installation directories, read-write below the work and artifact
 * directories, denied with EACCES elsewhere. Lower latency than a container,
 * weaker isolation (only file opens are confined).
 *
 * @date 2025
 */

#pragma once

#include "scriptjail/core/sandbox_runner.hpp"

#include <memory>

namespace scriptjail {
namespace core {

/**
 * @class InterceptionBackend
 * @brief Runs scripts as confined host child processes
 */
class InterceptionBackend : public SandboxBackend {
public:
    /**
     * @param config Runner configuration
     * @param provisioner Interpreter probe memo; the process-wide one for this
     *        configuration when null
     */
    explicit InterceptionBackend(RunnerConfig config,
                                 std::shared_ptr<ImageProvisioner> provisioner = nullptr);

    std::string Name() const override { return "interception"; }

    ExecutionImage Provision() override;

    std::filesystem::path SandboxWorkDirectory(
        const std::filesystem::path& host_work_dir) const override;

    ExecutionResult Execute(const ExecutionImage& image,
                            const PreparedExecution& execution) override;

    /**
     * @brief Variables every child starts with
     *
     * PATH, LANG, LC_ALL and TZ from the host when set, HOME and TMPDIR
     * pointing at the work directory, no bytecode writes.
     */
    static EnvironmentMap BaseEnvironment(const std::filesystem::path& work_dir);

    /// Full child environment: base, composed variables, confinement variables
    static EnvironmentMap ChildEnvironment(const ExecutionImage& image,
                                           const PreparedExecution& execution);

private:
    RunnerConfig config_;
    std::shared_ptr<ImageProvisioner> provisioner_;
};

} // namespace core
} // namespace scriptjail
