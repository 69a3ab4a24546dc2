/**
 * @file image_provisioner.hpp
 * @brief Build-once, reuse-forever execution environments
 *
 * An ExecutionImage is whatever a backend needs before it can run scripts:
 * a tagged container image for the container backend, a probed host
 * interpreter for the interception backend. Both record the runtime's
 * installation directories, which become the read-only part of the
 * confinement policy.
 *
 * **Memoization**:
 * ```
 * EnsureImage() --(first call, under the mutex)--> build --> memoized handle
 *               --(later calls)-----------------------------> same handle
 * ```
 * Concurrent first callers block on the mutex and share the single build.
 * A failed build memoizes nothing; the next call tries again.
 *
 * @date 2025
 */

#pragma once

#include "scriptjail/core/execution_types.hpp"
#include "scriptjail/core/runner_config.hpp"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include <filesystem>

namespace scriptjail {
namespace core {

/// Path of the open interceptor inside the execution image
constexpr const char* kImagePreloadPath = "/opt/scriptjail/libscriptjail_preload.so";

/// Image label carrying the build context digest
constexpr const char* kContextDigestLabel = "scriptjail.context-sha256";

/**
 * @enum ImageKind
 * @brief What an ExecutionImage refers to
 */
enum class ImageKind {
    CONTAINER_IMAGE,    ///< Tagged image in the local container runtime
    HOST_INTERPRETER    ///< Interpreter installed on the host
};

/**
 * @struct ExecutionImage
 * @brief Handle to a provisioned execution environment
 */
struct ExecutionImage {
    ImageKind kind{ImageKind::CONTAINER_IMAGE};
    std::string id;                                   ///< Image tag, or interpreter path
    std::string interpreter;                          ///< Command that runs a script
    std::filesystem::path preload_library;            ///< Interceptor as seen by the script
    std::vector<std::filesystem::path> runtime_paths; ///< Read-only installation directories
    std::string runtime_version;                      ///< Interpreter version
    std::string context_digest;                       ///< Build context SHA-256 (container)
};

/**
 * @class ImageProvisioner
 * @brief Mutex-guarded memo around one build function
 *
 * The build function is injected so tests can count and fail builds without
 * a container runtime.
 */
class ImageProvisioner {
public:
    using BuildFunction = std::function<ExecutionImage()>;

    explicit ImageProvisioner(BuildFunction build);

    /**
     * @brief Return the memoized image, building it on first use
     * @throws ProvisioningError if the build fails (nothing is memoized)
     */
    ExecutionImage EnsureImage();

    /// Memoized image, if any, without building
    std::optional<ExecutionImage> Current() const;

    /// Forget the memoized image; the next EnsureImage() rebuilds
    void Invalidate();

    /// Number of build attempts so far
    std::size_t BuildCount() const;

private:
    BuildFunction build_;
    mutable std::mutex mutex_;
    std::optional<ExecutionImage> image_;
    std::size_t build_count_{0};
};

/**
 * @class ImageCache
 * @brief Process-wide registry of provisioners, one per backend setup
 *
 * Every runner built with the same backend settings shares one provisioner
 * and therefore one image for the lifetime of the process.
 */
class ImageCache {
public:
    static ImageCache& Instance();

    /**
     * @brief Provisioner registered under key, created with build if absent
     *
     * The build function is only used when the key is new.
     */
    std::shared_ptr<ImageProvisioner> Acquire(const std::string& key,
                                              ImageProvisioner::BuildFunction build);

    /// Invalidate and drop every provisioner
    void Clear();

    std::size_t Size() const;

private:
    ImageCache() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ImageProvisioner>> provisioners_;
};

// ============================================================================
// BUILD FUNCTIONS
// ============================================================================

/**
 * @brief Files of the container build context, relative to the context dir
 *
 * The Dockerfile plus the interceptor sources compiled inside the image.
 */
const std::vector<std::filesystem::path>& ContainerContextFiles();

/**
 * @brief Build the execution image with the container runtime
 *
 * Stages the context files in a private temp directory, tags the image
 * `<image_prefix><8 random [a-z0-9]>`, labels it with the context digest and
 * probes the interpreter inside it for its installation directories.
 *
 * @throws ProvisioningError on a missing runtime, missing context file,
 *         build failure or unusable probe output
 */
ExecutionImage BuildContainerImage(const RunnerConfig& config);

/**
 * @brief Probe the host interpreter and check the interceptor exists
 *
 * The image runs the executable the interpreter reports for itself, not the
 * name found in PATH, which may be a launcher script.
 *
 * @throws ProvisioningError if either is unusable
 */
ExecutionImage ProbeHostInterpreter(const RunnerConfig& config);

/**
 * @brief Script run by the interpreter to list its installation directories
 *
 * Prints one JSON object: {"version": ..., "executable": ..., "paths": [...]}.
 */
const std::string& RuntimeProbeScript();

/**
 * @brief Parse the output of RuntimeProbeScript()
 *
 * Only the last non-empty line is considered. Relative paths are dropped,
 * duplicates and paths nested under another entry are collapsed.
 *
 * @throws ProvisioningError on malformed output
 */
ExecutionImage ParseRuntimeProbe(const std::string& output);

/// Cache key for ImageCache: backend plus the settings that shape the image
std::string ImageCacheKey(const RunnerConfig& config);

} // namespace core
} // namespace scriptjail
