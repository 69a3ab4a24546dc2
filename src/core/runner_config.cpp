/**
 * @file runner_config.cpp
 * @brief Environment and JSON overlays for RunnerConfig
 *
 * @date 2025
 */

#include "scriptjail/core/runner_config.hpp"
#include "scriptjail/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace scriptjail {
namespace core {

namespace {

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::chrono::milliseconds SecondsToMillis(double seconds) {
    if (seconds <= 0) {
        throw std::invalid_argument("timeout must be positive, got " + std::to_string(seconds));
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

} // anonymous namespace

const char* BackendName(BackendKind kind) {
    switch (kind) {
        case BackendKind::CONTAINER:    return "container";
        case BackendKind::INTERCEPTION: return "interception";
    }
    return "container";
}

std::optional<BackendKind> ParseBackendKind(const std::string& name) {
    auto lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lower == "container" || lower == "docker") return BackendKind::CONTAINER;
    if (lower == "interception" || lower == "preload") return BackendKind::INTERCEPTION;
    return std::nullopt;
}

std::optional<utils::NetworkMode> ParseNetworkMode(const std::string& name) {
    auto lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lower == "none") return utils::NetworkMode::NONE;
    if (lower == "bridge") return utils::NetworkMode::BRIDGE;
    if (lower == "host") return utils::NetworkMode::HOST;
    return std::nullopt;
}

// ============================================================================
// ENVIRONMENT OVERLAY
// ============================================================================

RunnerConfig RunnerConfig::FromEnvironment(RunnerConfig base) {
    if (auto value = GetEnv("SCRIPTJAIL_BACKEND")) {
        auto kind = ParseBackendKind(*value);
        if (!kind) {
            throw std::invalid_argument("SCRIPTJAIL_BACKEND: unknown backend '" + *value + "'");
        }
        base.backend = *kind;
    }

    if (auto value = GetEnv("SCRIPTJAIL_TIMEOUT")) {
        try {
            base.timeout = SecondsToMillis(std::stod(*value));
        } catch (const std::logic_error&) {
            throw std::invalid_argument("SCRIPTJAIL_TIMEOUT: not a positive number of seconds: '" +
                                        *value + "'");
        }
    }

    if (auto value = GetEnv("SCRIPTJAIL_BUILD_CONTEXT")) {
        base.build_context_dir = *value;
    }
    if (auto value = GetEnv("SCRIPTJAIL_INTERPRETER")) {
        base.interpreter = *value;
    }
    if (auto value = GetEnv("SCRIPTJAIL_PRELOAD")) {
        base.preload_library = *value;
    }
    if (auto value = GetEnv("SCRIPTJAIL_DOCKER")) {
        base.docker_binary = *value;
    }
    if (auto value = GetEnv("SCRIPTJAIL_DEFAULT_REGION")) {
        base.default_region = *value;
    }

    return base;
}

RunnerConfig RunnerConfig::FromEnvironment() {
    return FromEnvironment(RunnerConfig{});
}

// ============================================================================
// JSON OVERLAY
// ============================================================================

RunnerConfig RunnerConfig::FromJsonFile(const std::filesystem::path& path, RunnerConfig base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Invalid config file " + path.string() + ": expected an object");
    }

    try {
        if (j.contains("backend")) {
            auto name = j["backend"].get<std::string>();
            auto kind = ParseBackendKind(name);
            if (!kind) {
                throw std::runtime_error("unknown backend '" + name + "'");
            }
            base.backend = *kind;
        }
        if (j.contains("timeout_seconds")) {
            if (j["timeout_seconds"].is_null()) {
                base.timeout.reset();
            } else {
                base.timeout = SecondsToMillis(j["timeout_seconds"].get<double>());
            }
        }
        if (j.contains("network_mode")) {
            auto name = j["network_mode"].get<std::string>();
            auto mode = ParseNetworkMode(name);
            if (!mode) {
                throw std::runtime_error("unknown network mode '" + name + "'");
            }
            base.network_mode = *mode;
        }

        base.script_filename = j.value("script_filename", base.script_filename);
        base.remove_script_after_run = j.value("remove_script_after_run", base.remove_script_after_run);
        base.build_context_dir = j.value("build_context_dir", base.build_context_dir.string());
        base.image_prefix = j.value("image_prefix", base.image_prefix);
        base.container_workdir = j.value("container_workdir", base.container_workdir.string());
        base.docker_binary = j.value("docker_binary", base.docker_binary);
        base.interpreter = j.value("interpreter", base.interpreter);
        base.preload_library = j.value("preload_library", base.preload_library.string());
        base.default_region = j.value("default_region", base.default_region);
        base.artifact_dir_variable = j.value("artifact_dir_variable", base.artifact_dir_variable);

        if (j.contains("extra_read_only_paths")) {
            base.extra_read_only_paths.clear();
            for (const auto& entry : j["extra_read_only_paths"]) {
                base.extra_read_only_paths.emplace_back(entry.get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return base;
}

RunnerConfig RunnerConfig::FromJsonFile(const std::filesystem::path& path) {
    return FromJsonFile(path, RunnerConfig{});
}

void RunnerConfig::Validate() const {
    if (script_filename.empty() ||
        script_filename.find('/') != std::string::npos ||
        script_filename == "." || script_filename == "..") {
        throw std::invalid_argument("script_filename must be a plain file name: '" +
                                    script_filename + "'");
    }
    if (timeout && timeout->count() <= 0) {
        throw std::invalid_argument("timeout must be positive");
    }
    if (artifact_dir_variable.empty() || artifact_dir_variable.find('=') != std::string::npos) {
        throw std::invalid_argument("artifact_dir_variable is not a valid variable name");
    }
    if (backend == BackendKind::CONTAINER) {
        if (!container_workdir.is_absolute()) {
            throw std::invalid_argument("container_workdir must be absolute");
        }
        if (image_prefix.empty()) {
            throw std::invalid_argument("image_prefix must not be empty");
        }
    } else if (interpreter.empty()) {
        throw std::invalid_argument("interpreter must not be empty");
    }
    for (const auto& path : extra_read_only_paths) {
        if (!path.is_absolute()) {
            throw std::invalid_argument("extra read-only path must be absolute: " + path.string());
        }
    }
}

} // namespace core
} // namespace scriptjail
