/**
 * @file container_utils.cpp
 * @brief Implementation of the container runtime CLI wrapper
 *
 * **Container Lifecycle**:
 * ```
 * create -> start -> wait -> logs -> rm --force
 * ```
 *
 * Every call goes through RunProcess() with an argv vector and the caller's
 * unchanged environment, so every call reaches the same daemon and CLI
 * configuration. Values of container environment variables go through a
 * private `--env-file` and never show up in the process table or in debug
 * logs.
 *
 * @date 2025
 */

#include "scriptjail/utils/container_utils.hpp"
#include "scriptjail/utils/process_utils.hpp"
#include "scriptjail/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

using json = nlohmann::json;

namespace scriptjail {
namespace utils {

namespace {

std::string FirstLine(const std::string& text) {
    auto trimmed = StringUtils::Trim(text);
    auto newline = trimmed.find('\n');
    return newline == std::string::npos ? trimmed : trimmed.substr(0, newline);
}

std::string Describe(const ContainerExecResult& result) {
    if (result.timed_out) {
        return "timed out";
    }
    auto message = StringUtils::Trim(result.stderr_output);
    if (message.empty()) {
        message = StringUtils::Trim(result.stdout_output);
    }
    if (message.empty()) {
        message = "exit code " + std::to_string(result.exit_code);
    }
    return message;
}

// Names are never echoed with their values, which may be secrets
void ValidateVariableName(const std::string& key) {
    if (key.empty() || key.front() == '#' ||
        key.find_first_of(std::string("= \t\r\n\v\f\0", 8)) != std::string::npos) {
        throw std::invalid_argument("environment variable name cannot be passed to a container: '" +
                                    key + "'");
    }
}

void WriteAll(int fd, const std::string& content) {
    std::size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "write env file");
        }
        written += static_cast<std::size_t>(n);
    }
}

} // anonymous namespace

// ============================================================================
// ENVIRONMENT FILE
// ============================================================================

EnvironmentFile::EnvironmentFile(const std::map<std::string, std::string>& variables) {
    std::string content;
    for (const auto& [key, value] : variables) {
        ValidateVariableName(key);
        if (value.find_first_of(std::string("\r\n\0", 3)) != std::string::npos) {
            throw std::invalid_argument("value of " + key + " spans multiple lines");
        }
        content += key + "=" + value + "\n";
    }

    std::string pattern = (std::filesystem::temp_directory_path() / "scriptjail_env_XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        throw std::system_error(errno, std::generic_category(), "create env file directory");
    }
    dir_ = pattern;
    path_ = dir_ / "container.env";

    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        int err = errno;
        Remove();
        throw std::system_error(err, std::generic_category(), "create " + path_.string());
    }

    try {
        WriteAll(fd, content);
    } catch (const std::system_error&) {
        ::close(fd);
        Remove();
        throw;
    }
    ::close(fd);
}

EnvironmentFile::~EnvironmentFile() {
    Remove();
}

void EnvironmentFile::Remove() noexcept {
    if (dir_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
    if (ec) {
        spdlog::warn("Failed to remove env file directory {}: {}", dir_.string(), ec.message());
    }
    dir_.clear();
}

const char* NetworkModeName(NetworkMode mode) {
    switch (mode) {
        case NetworkMode::NONE:   return "none";
        case NetworkMode::BRIDGE: return "bridge";
        case NetworkMode::HOST:   return "host";
    }
    return "bridge";
}

// ============================================================================
// CONSTRUCTOR / RUNTIME DETECTION
// ============================================================================

ContainerUtils::ContainerUtils(std::string binary)
    : binary_(std::move(binary)) {
    spdlog::debug("Container utils using runtime CLI '{}'", binary_);
}

bool ContainerUtils::IsRuntimeAvailable(const std::string& binary) {
    if (!FindExecutable(binary)) {
        spdlog::debug("Runtime CLI '{}' not found in PATH", binary);
        return false;
    }

    ProcessOptions options;
    options.argv = {binary, "version", "--format", "{{.Server.Version}}"};
    options.timeout = std::chrono::seconds(30);

    try {
        auto result = RunProcess(options);
        return result.Succeeded();
    } catch (const std::system_error& e) {
        spdlog::debug("Runtime probe failed: {}", e.what());
        return false;
    }
}

std::string ContainerUtils::GetRuntimeVersion() const {
    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"},
                                       std::chrono::seconds(30));
    if (result.success) {
        return FirstLine(result.stdout_output);
    }
    return "unknown";
}

// ============================================================================
// IMAGES
// ============================================================================

void ContainerUtils::BuildImage(const ImageBuildOptions& options) const {
    spdlog::info("Building image {} from {}", options.tag, options.context_dir.string());

    std::vector<std::string> args = {"build", "--tag", options.tag};
    for (const auto& [key, value] : options.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
    args.push_back(options.context_dir.string());

    std::optional<std::chrono::milliseconds> timeout;
    if (options.timeout) {
        timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*options.timeout);
    }

    auto result = ExecuteDockerCommand(args, timeout);
    if (!result.success) {
        spdlog::error("Image build failed: {}", Describe(result));
        throw std::runtime_error("image build for " + options.tag + " failed: " + Describe(result));
    }

    spdlog::info("Image {} built in {} ms", options.tag, result.duration.count());
}

bool ContainerUtils::ImageExists(const std::string& tag) const {
    return ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", tag}).success;
}

std::optional<std::map<std::string, std::string>>
ContainerUtils::GetImageLabels(const std::string& tag) const {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{json .Config.Labels}}", tag});
    if (!result.success) {
        return std::nullopt;
    }

    std::map<std::string, std::string> labels;
    try {
        json j = json::parse(result.stdout_output);
        if (j.is_object()) {
            for (const auto& [key, value] : j.items()) {
                if (value.is_string()) {
                    labels[key] = value.get<std::string>();
                }
            }
        }
    } catch (const json::exception& e) {
        spdlog::warn("Failed to parse labels of {}: {}", tag, e.what());
        return std::nullopt;
    }
    return labels;
}

bool ContainerUtils::RemoveImage(const std::string& tag, bool force) const {
    spdlog::info("Removing image: {} (force: {})", tag, force);

    std::vector<std::string> args = {"image", "rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(tag);

    auto result = ExecuteDockerCommand(args);
    if (!result.success) {
        spdlog::warn("Failed to remove image {}: {}", tag, Describe(result));
        return false;
    }
    return true;
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::vector<std::string> ContainerUtils::BuildCreateCommand(const ContainerConfig& config,
                                                            const std::filesystem::path& env_file) const {
    std::vector<std::string> args;

    args.push_back("create");

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    args.push_back("--network");
    args.push_back(NetworkModeName(config.network_mode));

    if (!config.user.empty()) {
        args.push_back("--user");
        args.push_back(config.user);
    }

    // Volume mounts; the -v syntax is colon separated
    for (const auto& mount : config.mounts) {
        auto host = mount.host_path.string();
        auto target = mount.container_path.string();
        if (host.find(':') != std::string::npos || target.find(':') != std::string::npos) {
            throw std::invalid_argument("mount path contains ':': " + host + " -> " + target);
        }
        args.push_back("-v");
        args.push_back(host + ":" + target + (mount.read_only ? ":ro" : ":rw"));
    }

    for (const auto& [key, value] : config.inline_environment) {
        ValidateVariableName(key);
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }
    if (!env_file.empty()) {
        args.push_back("--env-file");
        args.push_back(env_file.string());
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir.string());
    }

    // Image (must be last before command)
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

std::string ContainerUtils::CreateContainer(const ContainerConfig& config) const {
    spdlog::debug("Creating container from {}", config.image);

    std::optional<EnvironmentFile> env_file;
    if (!config.environment_vars.empty()) {
        env_file.emplace(config.environment_vars);
    }

    auto args = BuildCreateCommand(config, env_file ? env_file->Path() : std::filesystem::path());
    auto result = ExecuteDockerCommand(args);

    if (!result.success) {
        spdlog::error("Failed to create container: {}", Describe(result));
        throw std::runtime_error("container create failed: " + Describe(result));
    }

    std::string container_id = FirstLine(result.stdout_output);
    if (container_id.empty()) {
        throw std::runtime_error("container create returned no id");
    }

    spdlog::debug("Container created: {}", container_id.substr(0, 12));
    return container_id;
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

void ContainerUtils::StartContainer(const std::string& container_id) const {
    spdlog::debug("Starting container: {}", container_id.substr(0, 12));

    auto result = ExecuteDockerCommand({"start", container_id});
    if (!result.success) {
        spdlog::error("Failed to start container: {}", Describe(result));
        throw std::runtime_error("container start failed: " + Describe(result));
    }
}

std::optional<int> ContainerUtils::WaitForContainer(
    const std::string& container_id,
    std::optional<std::chrono::milliseconds> timeout) const {

    auto result = ExecuteDockerCommand({"wait", container_id}, timeout);
    if (result.timed_out) {
        spdlog::warn("Container {} still running after {} ms", container_id.substr(0, 12),
                     timeout ? timeout->count() : 0);
        return std::nullopt;
    }
    if (!result.success) {
        throw std::runtime_error("container wait failed: " + Describe(result));
    }

    auto line = FirstLine(result.stdout_output);
    try {
        return std::stoi(line);
    } catch (const std::exception&) {
        throw std::runtime_error("unexpected output from container wait: '" + line + "'");
    }
}

bool ContainerUtils::KillContainer(const std::string& container_id) const {
    spdlog::info("Killing container: {}", container_id.substr(0, 12));

    auto result = ExecuteDockerCommand({"kill", container_id});
    if (!result.success) {
        spdlog::warn("Failed to kill container: {}", Describe(result));
        return false;
    }
    return true;
}

ContainerExecResult ContainerUtils::GetContainerLogs(const std::string& container_id) const {
    auto result = ExecuteDockerCommand({"logs", container_id});
    if (!result.success) {
        spdlog::warn("Failed to read logs of {}: exit code {}", container_id.substr(0, 12),
                     result.exit_code);
    }
    return result;
}

bool ContainerUtils::RemoveContainer(const std::string& container_id, bool force) const {
    spdlog::debug("Removing container: {} (force: {})", container_id.substr(0, 12), force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args);
    if (!result.success) {
        spdlog::warn("Failed to remove container {}: {}", container_id.substr(0, 12),
                     Describe(result));
        return false;
    }
    return true;
}

ContainerExecResult ContainerUtils::RunContainer(
    ContainerConfig config,
    std::optional<std::chrono::milliseconds> timeout) const {

    if (config.name.empty()) {
        config.name = "scriptjail_run_" + StringUtils::RandomAlphanumeric(12);
    }

    std::optional<EnvironmentFile> env_file;
    if (!config.environment_vars.empty()) {
        env_file.emplace(config.environment_vars);
    }

    auto args = BuildCreateCommand(config, env_file ? env_file->Path() : std::filesystem::path());
    args.front() = "run";
    args.insert(args.begin() + 1, "--rm");

    auto result = ExecuteDockerCommand(args, timeout);
    if (result.timed_out) {
        spdlog::warn("Container {} timed out, removing it", config.name);
        RemoveContainer(config.name, true);
    }
    return result;
}

// ============================================================================
// INTERNAL HELPER FUNCTIONS
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteDockerCommand(
    const std::vector<std::string>& args,
    std::optional<std::chrono::milliseconds> timeout) const {

    ProcessOptions options;
    options.argv.reserve(args.size() + 1);
    options.argv.push_back(binary_);
    options.argv.insert(options.argv.end(), args.begin(), args.end());
    options.timeout = timeout;

    spdlog::debug("Executing: {} {}", binary_, StringUtils::Join(args, " "));

    ContainerExecResult exec_result;
    try {
        auto result = RunProcess(options);
        exec_result.exit_code = result.exit_code;
        exec_result.stdout_output = std::move(result.stdout_output);
        exec_result.stderr_output = std::move(result.stderr_output);
        exec_result.duration = result.duration;
        exec_result.timed_out = result.timed_out;
        exec_result.success = result.Succeeded();
    } catch (const std::system_error& e) {
        exec_result.exit_code = 127;
        exec_result.stderr_output = e.what();
        exec_result.success = false;
    }

    return exec_result;
}

} // namespace utils
} // namespace scriptjail
