/**
 * @file container_backend.hpp
 * @brief Default backend: one disposable container per execution
 *
 * The work directory is bind-mounted read-write at the configured mount
 * point and the artifact directory, if any, at its own host path. No other
 * host path is mounted. Inside the container the script additionally runs
 * under the open interceptor baked into the image, so the container's own
 * files outside the runtime directories are denied as well.
 *
 * The container is removed with `rm --force` on every exit path; the image
 * is kept for the next execution.
 *
 * @date 2025
 */

#pragma once

#include "scriptjail/core/sandbox_runner.hpp"
#include "scriptjail/utils/container_utils.hpp"

#include <memory>

namespace scriptjail {
namespace core {

/**
 * @class ContainerBackend
 * @brief Runs scripts with the container runtime CLI
 */
class ContainerBackend : public SandboxBackend {
public:
    /**
     * @param config Runner configuration
     * @param provisioner Image provisioner; the process-wide one for this
     *        configuration when null
     */
    explicit ContainerBackend(RunnerConfig config,
                              std::shared_ptr<ImageProvisioner> provisioner = nullptr);

    std::string Name() const override { return "container"; }

    ExecutionImage Provision() override;

    std::filesystem::path SandboxWorkDirectory(
        const std::filesystem::path& host_work_dir) const override;

    ExecutionResult Execute(const ExecutionImage& image,
                            const PreparedExecution& execution) override;

    /**
     * @brief Forget the memoized image and remove it from the runtime
     * @return false if there was no image or removal failed
     */
    bool RetireImage();

    /// Container configuration for one execution
    utils::ContainerConfig BuildContainerConfig(const ExecutionImage& image,
                                                const PreparedExecution& execution) const;

private:
    RunnerConfig config_;
    std::shared_ptr<ImageProvisioner> provisioner_;
    utils::ContainerUtils docker_;
};

} // namespace core
} // namespace scriptjail
