/**
 * @file runner_config.hpp
 * @brief Configuration of the sandbox runner and its backends
 *
 * Defaults live in the struct. FromEnvironment() and FromJsonFile() overlay a
 * base configuration, so the layers compose:
 *
 * @code
 * auto config = RunnerConfig::FromJsonFile("scriptjail.json");
 * config = RunnerConfig::FromEnvironment(config);
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "scriptjail/utils/container_utils.hpp"

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <chrono>

// Build context holding docker/Dockerfile and the interceptor sources
#ifndef SCRIPTJAIL_DEFAULT_CONTEXT_DIR
#define SCRIPTJAIL_DEFAULT_CONTEXT_DIR "."
#endif

// Host path of the built open interceptor (interception backend)
#ifndef SCRIPTJAIL_DEFAULT_PRELOAD_PATH
#define SCRIPTJAIL_DEFAULT_PRELOAD_PATH "libscriptjail_preload.so"
#endif

namespace scriptjail {
namespace core {

/**
 * @enum BackendKind
 * @brief Confinement strategy
 */
enum class BackendKind {
    CONTAINER,     ///< Disposable container, work dir bind-mounted (default)
    INTERCEPTION   ///< Host interpreter child under the open interceptor
};

/**
 * @struct RunnerConfig
 * @brief Runner and backend settings
 */
struct RunnerConfig {
    // Execution
    BackendKind backend{BackendKind::CONTAINER};          ///< Confinement strategy
    std::optional<std::chrono::milliseconds> timeout;     ///< Unset: block until exit
    std::string script_filename{"script.py"};             ///< Name of the script inside the work dir
    bool remove_script_after_run{true};                   ///< Delete the script file afterwards

    // Container backend
    std::filesystem::path build_context_dir{SCRIPTJAIL_DEFAULT_CONTEXT_DIR};  ///< Dockerfile + sources
    std::string image_prefix{"scriptjail_"};              ///< Image tag prefix
    std::filesystem::path container_workdir{"/workspace"};///< Work dir mount point
    std::string docker_binary{"docker"};                  ///< Runtime CLI
    utils::NetworkMode network_mode{utils::NetworkMode::BRIDGE};  ///< Container network

    // Interception backend
    std::string interpreter{"python3"};                   ///< Host interpreter
    std::filesystem::path preload_library{SCRIPTJAIL_DEFAULT_PRELOAD_PATH};  ///< Built interceptor
    std::vector<std::filesystem::path> extra_read_only_paths;  ///< Added to the probed runtime paths

    // Environment
    std::string default_region;                           ///< Used when the host sets no region
    std::string artifact_dir_variable{"ARTIFACT_DIR"};    ///< Name of the artifact dir variable

    /**
     * @brief Overlay SCRIPTJAIL_* variables of the current process
     *
     * Reads SCRIPTJAIL_BACKEND, SCRIPTJAIL_TIMEOUT (seconds),
     * SCRIPTJAIL_BUILD_CONTEXT, SCRIPTJAIL_INTERPRETER, SCRIPTJAIL_PRELOAD,
     * SCRIPTJAIL_DOCKER and SCRIPTJAIL_DEFAULT_REGION.
     *
     * @throws std::invalid_argument on an unparsable value
     */
    static RunnerConfig FromEnvironment(RunnerConfig base);

    /// FromEnvironment() over the built-in defaults
    static RunnerConfig FromEnvironment();

    /**
     * @brief Overlay the keys present in a JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static RunnerConfig FromJsonFile(const std::filesystem::path& path, RunnerConfig base);

    /// FromJsonFile() over the built-in defaults
    static RunnerConfig FromJsonFile(const std::filesystem::path& path);

    /// @throws std::invalid_argument if a field is unusable
    void Validate() const;
};

/// "container" or "interception"
const char* BackendName(BackendKind kind);

/// Inverse of BackendName(), case-insensitive
std::optional<BackendKind> ParseBackendKind(const std::string& name);

/// "none", "bridge" or "host"
std::optional<utils::NetworkMode> ParseNetworkMode(const std::string& name);

} // namespace core
} // namespace scriptjail
