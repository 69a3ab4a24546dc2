/**
 * @file environment_injector.cpp
 * @brief Implementation of environment composition and redaction
 *
 * @date 2025
 */

#include "scriptjail/core/environment_injector.hpp"
#include "scriptjail/utils/string_utils.hpp"

#include <cstdlib>

namespace scriptjail {
namespace core {

namespace {

constexpr const char* kRedacted = "********";

} // anonymous namespace

EnvironmentInjector::EnvironmentInjector(EnvironmentMap host_env,
                                         std::string default_region,
                                         std::string artifact_variable)
    : host_env_(std::move(host_env)),
      default_region_(std::move(default_region)),
      artifact_variable_(std::move(artifact_variable)) {}

EnvironmentMap EnvironmentInjector::CaptureHostEnvironment(const std::string& artifact_variable) {
    EnvironmentMap env;
    for (const std::string& name : {std::string(kEnvRegion), std::string(kEnvDefaultRegion),
                                    artifact_variable}) {
        if (const char* value = std::getenv(name.c_str())) {
            env[name] = value;
        }
    }
    return env;
}

std::string EnvironmentInjector::HostValue(const std::string& name) const {
    auto it = host_env_.find(name);
    return it == host_env_.end() ? std::string() : it->second;
}

std::optional<std::filesystem::path> EnvironmentInjector::ExternalArtifactDirectory() const {
    auto value = HostValue(artifact_variable_);
    if (value.empty()) {
        return std::nullopt;
    }
    return std::filesystem::absolute(value).lexically_normal();
}

EnvironmentMap EnvironmentInjector::Compose(const CredentialSet& credentials,
                                            const EnvironmentMap& overrides,
                                            const std::filesystem::path& sandbox_work_dir) const {
    EnvironmentMap env;

    // Region: either host variable fills the other, then the configured default
    std::string region = HostValue(kEnvRegion);
    std::string default_region = HostValue(kEnvDefaultRegion);
    if (region.empty()) region = default_region;
    if (default_region.empty()) default_region = region;
    if (region.empty()) {
        region = default_region = default_region_;
    }
    if (!region.empty()) {
        env[kEnvRegion] = region;
        env[kEnvDefaultRegion] = default_region;
    }

    if (!credentials.access_key.empty()) env[kEnvAccessKeyId] = credentials.access_key;
    if (!credentials.secret_key.empty()) env[kEnvSecretAccessKey] = credentials.secret_key;
    if (!credentials.session_token.empty()) env[kEnvSessionToken] = credentials.session_token;
    if (!credentials.account_id.empty()) env[kEnvAccountId] = credentials.account_id;

    if (auto artifact_dir = ExternalArtifactDirectory()) {
        env[artifact_variable_] = artifact_dir->string();
    } else {
        env[artifact_variable_] = sandbox_work_dir.string();
    }

    for (const auto& [key, value] : overrides) {
        env[key] = value;
    }

    return env;
}

// ============================================================================
// REDACTION
// ============================================================================

bool EnvironmentInjector::IsSensitive(const std::string& name) {
    if (name == kEnvAccessKeyId || name == kEnvSecretAccessKey || name == kEnvSessionToken) {
        return true;
    }
    auto lower = utils::StringUtils::ToLower(name);
    return lower.find("secret") != std::string::npos ||
           lower.find("token") != std::string::npos ||
           lower.find("password") != std::string::npos;
}

EnvironmentMap EnvironmentInjector::RedactForLog(const EnvironmentMap& env) {
    EnvironmentMap redacted = env;
    for (auto& [key, value] : redacted) {
        if (!value.empty() && IsSensitive(key)) {
            value = kRedacted;
        }
    }
    return redacted;
}

} // namespace core
} // namespace scriptjail
