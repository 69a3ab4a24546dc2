/**
 * @file environment_injector.hpp
 * @brief Environment composition for sandboxed scripts
 *
 * **Composition order** (later entries win):
 * 1. Region: AWS_REGION / AWS_DEFAULT_REGION from the host, either one
 *    filling the other, else the configured default; omitted when all are empty
 * 2. Credentials: AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN,
 *    AWS_ACCOUNT_ID (each only when non-empty)
 * 3. Artifact directory variable: the host's configured artifact directory,
 *    else the work directory as the script sees it
 * 4. Caller overrides
 *
 * Only the region and artifact variables are read from the host; the rest of
 * the host environment never reaches the script through this class.
 *
 * @date 2025
 */

#pragma once

#include "scriptjail/core/execution_types.hpp"

#include <string>
#include <optional>
#include <filesystem>

namespace scriptjail {
namespace core {

constexpr const char* kEnvAccessKeyId = "AWS_ACCESS_KEY_ID";
constexpr const char* kEnvSecretAccessKey = "AWS_SECRET_ACCESS_KEY";
constexpr const char* kEnvSessionToken = "AWS_SESSION_TOKEN";
constexpr const char* kEnvAccountId = "AWS_ACCOUNT_ID";
constexpr const char* kEnvRegion = "AWS_REGION";
constexpr const char* kEnvDefaultRegion = "AWS_DEFAULT_REGION";

/**
 * @class EnvironmentInjector
 * @brief Builds the environment mapping handed to one execution
 */
class EnvironmentInjector {
public:
    /**
     * @param host_env Host variables (see CaptureHostEnvironment())
     * @param default_region Region used when the host sets none
     * @param artifact_variable Name of the artifact directory variable
     */
    explicit EnvironmentInjector(EnvironmentMap host_env,
                                 std::string default_region = {},
                                 std::string artifact_variable = "ARTIFACT_DIR");

    /**
     * @brief Snapshot of the host variables the injector consults
     * @param artifact_variable Name of the artifact directory variable
     */
    static EnvironmentMap CaptureHostEnvironment(const std::string& artifact_variable = "ARTIFACT_DIR");

    /**
     * @brief Artifact directory configured on the host, if any
     *
     * A relative value is made absolute against the current directory.
     */
    std::optional<std::filesystem::path> ExternalArtifactDirectory() const;

    /**
     * @brief Compose the environment for one execution
     * @param credentials Credentials of the request, may be empty
     * @param overrides Caller-supplied variables, win on collision
     * @param sandbox_work_dir Work directory as seen from inside the sandbox
     */
    EnvironmentMap Compose(const CredentialSet& credentials,
                           const EnvironmentMap& overrides,
                           const std::filesystem::path& sandbox_work_dir) const;

    /// Copy with credential-like values masked
    static EnvironmentMap RedactForLog(const EnvironmentMap& env);

    /// true for the credential variables and names containing SECRET, TOKEN or PASSWORD
    static bool IsSensitive(const std::string& name);

    const std::string& ArtifactVariable() const { return artifact_variable_; }

private:
    EnvironmentMap host_env_;
    std::string default_region_;
    std::string artifact_variable_;

    std::string HostValue(const std::string& name) const;
};

} // namespace core
} // namespace scriptjail
