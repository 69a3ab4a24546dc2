/**
 * @file container_utils.hpp
 * @brief Docker CLI wrapper for image builds and single-shot containers
 *
 * Drives the container runtime through its command line. Every invocation is
 * an argv vector, so paths and values are never re-parsed by a shell.
 * Environment values for a container are written to an owner-only
 * `--env-file` that exists for the duration of one CLI call, which keeps
 * secrets off the command line and out of the CLI's own environment.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <chrono>

namespace scriptjail {
namespace utils {

/**
 * @enum NetworkMode
 * @brief Container network modes
 */
enum class NetworkMode {
    NONE,     ///< No network access
    BRIDGE,   ///< Default bridge network
    HOST      ///< Host network stack
};

/**
 * @struct MountSpec
 * @brief One bind mount
 */
struct MountSpec {
    std::filesystem::path host_path;       ///< Source on the host
    std::filesystem::path container_path;  ///< Target inside the container
    bool read_only{false};                 ///< Mount read-only
};

/**
 * @struct ContainerConfig
 * @brief Everything needed to create one container
 */
struct ContainerConfig {
    std::string name;                                     ///< Container name (optional)
    std::string image;                                    ///< Image tag
    NetworkMode network_mode{NetworkMode::BRIDGE};        ///< Network mode
    std::string user;                                     ///< "uid:gid", empty for image default
    std::vector<MountSpec> mounts;                        ///< Bind mounts
    std::map<std::string, std::string> environment_vars;  ///< Variables for the container process, via env file
    std::map<std::string, std::string> inline_environment; ///< Non-secret variables written as `-e KEY=VALUE`
    std::filesystem::path working_dir{"/workspace"};      ///< Working directory inside
    std::map<std::string, std::string> labels;            ///< Container labels
    std::vector<std::string> command;                     ///< Command; image entrypoint when empty
};

/**
 * @struct ImageBuildOptions
 * @brief Inputs of one image build
 */
struct ImageBuildOptions {
    std::filesystem::path context_dir;              ///< Build context directory
    std::string tag;                                ///< Tag for the new image
    std::map<std::string, std::string> labels;      ///< Image labels
    std::optional<std::chrono::seconds> timeout;    ///< Abort the build after this long
};

/**
 * @struct ContainerExecResult
 * @brief Result of one runtime CLI call
 */
struct ContainerExecResult {
    int exit_code{0};                       ///< Exit code of the CLI
    std::string stdout_output;              ///< Standard output
    std::string stderr_output;              ///< Standard error
    std::chrono::milliseconds duration{0};  ///< Call duration
    bool timed_out{false};                  ///< CLI killed at its deadline
    bool success{false};                    ///< exit_code == 0 and not timed out
};

/**
 * @class EnvironmentFile
 * @brief Owner-only `--env-file` for one CLI call
 *
 * The file is created with mode 0600 inside a private mkdtemp() directory and
 * both are removed on destruction. The runtime reads it line by line without
 * quoting, so names and values must fit on one line.
 */
class EnvironmentFile {
public:
    /**
     * @param variables Container variables
     * @throws std::invalid_argument on a name or value the format cannot carry
     * @throws std::system_error if the file cannot be written
     */
    explicit EnvironmentFile(const std::map<std::string, std::string>& variables);
    ~EnvironmentFile();

    EnvironmentFile(const EnvironmentFile&) = delete;
    EnvironmentFile& operator=(const EnvironmentFile&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path dir_;
    std::filesystem::path path_;

    void Remove() noexcept;
};

/**
 * @class ContainerUtils
 * @brief Container lifecycle through the runtime CLI
 *
 * **Lifecycle of one execution**:
 * ```
 * CreateContainer -> StartContainer -> WaitForContainer -> GetContainerLogs -> RemoveContainer
 * ```
 *
 * Operations whose failure leaves nothing usable (build, create, start, wait)
 * throw std::runtime_error carrying the CLI's stderr. Teardown operations
 * (kill, remove) return false and log instead, so they are safe on error paths.
 *
 * **Usage Example**:
 * @code
 * ContainerUtils docker;
 *
 * ContainerConfig config;
 * config.image = "scriptjail_ab12cd34";
 * config.mounts.push_back({"/tmp/work", "/workspace", false});
 * config.command = {"python", "script.py"};
 *
 * std::string id = docker.CreateContainer(config);
 * docker.StartContainer(id);
 * auto exit_code = docker.WaitForContainer(id, std::chrono::seconds(60));
 * auto logs = docker.GetContainerLogs(id);
 * docker.RemoveContainer(id, true);
 * @endcode
 */
class ContainerUtils {
public:
    /**
     * @brief Construct for a runtime binary
     * @param binary CLI name or path (docker, podman)
     */
    explicit ContainerUtils(std::string binary = "docker");

    /**
     * @brief Check that the runtime CLI exists and its daemon answers
     * @param binary CLI name or path
     * @return true if `<binary> version` succeeds
     */
    static bool IsRuntimeAvailable(const std::string& binary = "docker");

    /// Server version reported by the runtime, "unknown" if unavailable
    std::string GetRuntimeVersion() const;

    // ========================================================================
    // IMAGES
    // ========================================================================

    /**
     * @brief Build and tag an image from a context directory
     * @throws std::runtime_error on build failure or timeout
     */
    void BuildImage(const ImageBuildOptions& options) const;

    /// true if an image with this tag exists locally
    bool ImageExists(const std::string& tag) const;

    /**
     * @brief Labels of a local image
     * @return Label map, nullopt if the image cannot be inspected
     */
    std::optional<std::map<std::string, std::string>> GetImageLabels(const std::string& tag) const;

    /// Remove a local image; false (logged) on failure
    bool RemoveImage(const std::string& tag, bool force = false) const;

    // ========================================================================
    // CONTAINERS
    // ========================================================================

    /**
     * @brief Create (but do not start) a container
     * @return Container ID
     * @throws std::invalid_argument if a mount path or variable cannot be expressed
     * @throws std::system_error if the env file cannot be written
     * @throws std::runtime_error if the runtime rejects the container
     */
    std::string CreateContainer(const ContainerConfig& config) const;

    /// @throws std::runtime_error if the container does not start
    void StartContainer(const std::string& container_id) const;

    /**
     * @brief Block until the container exits
     * @param container_id Container ID
     * @param timeout Give up after this long; unset waits indefinitely
     * @return Container exit code, nullopt if the timeout passed first
     * @throws std::runtime_error if the wait itself fails
     */
    std::optional<int> WaitForContainer(const std::string& container_id,
                                        std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    /// Kill a running container; false (logged) on failure
    bool KillContainer(const std::string& container_id) const;

    /**
     * @brief Retrieve container output
     *
     * stdout and stderr of the container process arrive on the CLI's own
     * stdout and stderr and are returned separately.
     */
    ContainerExecResult GetContainerLogs(const std::string& container_id) const;

    /// Remove a container; false (logged) on failure
    bool RemoveContainer(const std::string& container_id, bool force = false) const;

    /**
     * @brief Run a short-lived container attached (`run --rm`)
     *
     * On timeout the container is force-removed by name; a name is generated
     * when the config has none.
     *
     * @return Output and exit code of the container command
     */
    ContainerExecResult RunContainer(ContainerConfig config,
                                     std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    /**
     * @brief CLI arguments for `create`, without the binary
     *
     * Only inline_environment is written on the command line. environment_vars
     * are referenced through env_file, which CreateContainer() writes.
     *
     * @param config Container settings
     * @param env_file Env file to pass with `--env-file`, empty for none
     * @throws std::invalid_argument if a mount path contains ':' or an inline
     *         variable name is unusable
     */
    std::vector<std::string> BuildCreateCommand(const ContainerConfig& config,
                                                const std::filesystem::path& env_file = {}) const;

    const std::string& GetBinary() const { return binary_; }

private:
    std::string binary_;  ///< Runtime CLI

    ContainerExecResult ExecuteDockerCommand(
        const std::vector<std::string>& args,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;
};

/// CLI spelling of a network mode
const char* NetworkModeName(NetworkMode mode);

} // namespace utils
} // namespace scriptjail
