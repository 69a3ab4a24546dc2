/**
 * @file execution_types.hpp
 * @brief Request, result and error types shared by every sandbox component
 *
 * An ExecutionRequest is built per call and discarded afterwards. Credentials
 * travel inside the request only; nothing here is persisted or logged.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <map>
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace scriptjail {
namespace core {

/// Environment variable name to value
using EnvironmentMap = std::map<std::string, std::string>;

/**
 * @struct CredentialSet
 * @brief Temporary cloud credentials handed to one execution
 *
 * All fields are opaque. An empty set is valid for scripts that make no
 * cloud calls.
 */
struct CredentialSet {
    std::string access_key;     ///< AWS access key id
    std::string secret_key;     ///< AWS secret access key
    std::string session_token;  ///< STS session token
    std::string account_id;     ///< Account id (optional)

    bool Empty() const {
        return access_key.empty() && secret_key.empty() && session_token.empty();
    }
};

/**
 * @struct ExecutionRequest
 * @brief One script execution as supplied by the caller
 */
struct ExecutionRequest {
    std::string script;                     ///< Script body (host scripting language)
    std::filesystem::path work_directory;   ///< Host directory, created if missing
    CredentialSet credentials;              ///< May be empty
    EnvironmentMap extra_env;               ///< Caller overrides, win on collision
};

/**
 * @struct ExecutionResult
 * @brief Captured outcome of one sandboxed run
 *
 * exit_code 0 means the script ran to completion without an uncaught error.
 * A non-zero code is returned to the caller, never raised by Run().
 */
struct ExecutionResult {
    std::string stdout_output;                 ///< Script standard output
    std::string stderr_output;                 ///< Script standard error
    int exit_code{0};                          ///< Exit status of the script
    bool timed_out{false};                     ///< Killed at the caller's deadline
    std::chrono::milliseconds duration{0};     ///< Wall time of the execution step
    std::string backend;                       ///< Backend that produced the result

    bool Succeeded() const { return exit_code == 0 && !timed_out; }

    /// stdout followed by stderr, for callers that want one stream
    std::string CombinedOutput() const {
        if (stderr_output.empty()) return stdout_output;
        if (stdout_output.empty()) return stderr_output;
        std::string combined = stdout_output;
        if (combined.back() != '\n') combined += '\n';
        return combined + stderr_output;
    }
};

/// Exit code reported when an execution is killed at its deadline
constexpr int kTimeoutExitCode = 124;

/**
 * @class SandboxError
 * @brief Base of every exception raised by the sandbox subsystem
 */
class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ProvisioningError
 * @brief The execution image could not be built or probed
 *
 * Fatal for the call. Nothing is memoized when this is thrown, so the next
 * call retries the build.
 */
class ProvisioningError : public SandboxError {
public:
    explicit ProvisioningError(const std::string& message)
        : SandboxError("provisioning failed: " + message) {}
};

/**
 * @class InfrastructureError
 * @brief The execution backend failed (unreachable, start failure, fork failure)
 */
class InfrastructureError : public SandboxError {
public:
    explicit InfrastructureError(const std::string& message)
        : SandboxError("sandbox infrastructure error: " + message) {}
};

/**
 * @class ScriptFailedError
 * @brief Raised by SandboxRunner::RunChecked() for a non-zero exit
 */
class ScriptFailedError : public SandboxError {
public:
    explicit ScriptFailedError(ExecutionResult result)
        : SandboxError(Describe(result)), result_(std::move(result)) {}

    const ExecutionResult& Result() const { return result_; }

private:
    static std::string Describe(const ExecutionResult& result) {
        if (result.timed_out) {
            return "script timed out after " +
                   std::to_string(result.duration.count()) + " ms";
        }
        return "script exited with code " + std::to_string(result.exit_code);
    }

    ExecutionResult result_;
};

} // namespace core
} // namespace scriptjail
