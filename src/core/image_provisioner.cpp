/**
 * @file image_provisioner.cpp
 * @brief Image memoization, container image build and interpreter probing
 *
 * **Container build**:
 * ```
 * stage context in temp dir -> SHA-256 of staged files -> docker build --label
 *   -> probe interpreter inside the image -> ExecutionImage
 * ```
 *
 * The staging directory is removed on every exit path. If the probe fails the
 * freshly built image is removed again, so a failed provisioning leaves
 * nothing behind.
 *
 * @date 2025
 */

#include "scriptjail/core/image_provisioner.hpp"
#include "scriptjail/core/confinement_policy.hpp"
#include "scriptjail/utils/container_utils.hpp"
#include "scriptjail/utils/hash_utils.hpp"
#include "scriptjail/utils/process_utils.hpp"
#include "scriptjail/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <system_error>

#include <unistd.h>

using json = nlohmann::json;

namespace scriptjail {
namespace core {

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::seconds kProbeTimeout{120};

/**
 * @brief Removes a staging directory when it goes out of scope
 */
class StagingDirectory {
public:
    explicit StagingDirectory(fs::path path) : path_(std::move(path)) {
        fs::create_directories(path_);
    }

    ~StagingDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove staging directory {}: {}", path_.string(), ec.message());
        }
    }

    StagingDirectory(const StagingDirectory&) = delete;
    StagingDirectory& operator=(const StagingDirectory&) = delete;

    const fs::path& Path() const { return path_; }

private:
    fs::path path_;
};

fs::path StripTrailingSeparator(const fs::path& path) {
    auto normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

} // anonymous namespace

// ============================================================================
// IMAGE PROVISIONER
// ============================================================================

ImageProvisioner::ImageProvisioner(BuildFunction build)
    : build_(std::move(build)) {
    if (!build_) {
        throw std::invalid_argument("ImageProvisioner requires a build function");
    }
}

ExecutionImage ImageProvisioner::EnsureImage() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (image_) {
        return *image_;
    }

    ++build_count_;
    spdlog::debug("Provisioning execution image (attempt {})", build_count_);

    try {
        image_ = build_();
    } catch (const ProvisioningError&) {
        throw;
    } catch (const std::exception& e) {
        throw ProvisioningError(e.what());
    }

    spdlog::info("Execution image ready: {}", image_->id);
    return *image_;
}

std::optional<ExecutionImage> ImageProvisioner::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return image_;
}

void ImageProvisioner::Invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (image_) {
        spdlog::debug("Forgetting execution image {}", image_->id);
    }
    image_.reset();
}

std::size_t ImageProvisioner::BuildCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return build_count_;
}

// ============================================================================
// IMAGE CACHE
// ============================================================================

ImageCache& ImageCache::Instance() {
    static ImageCache instance;
    return instance;
}

std::shared_ptr<ImageProvisioner> ImageCache::Acquire(const std::string& key,
                                                      ImageProvisioner::BuildFunction build) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = provisioners_.find(key);
    if (it != provisioners_.end()) {
        return it->second;
    }

    auto provisioner = std::make_shared<ImageProvisioner>(std::move(build));
    provisioners_.emplace(key, provisioner);
    return provisioner;
}

void ImageCache::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, provisioner] : provisioners_) {
        provisioner->Invalidate();
    }
    provisioners_.clear();
}

std::size_t ImageCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return provisioners_.size();
}

std::string ImageCacheKey(const RunnerConfig& config) {
    std::string key = BackendName(config.backend);
    if (config.backend == BackendKind::CONTAINER) {
        key += "|" + config.docker_binary;
        key += "|" + fs::absolute(config.build_context_dir).lexically_normal().string();
        key += "|" + config.image_prefix;
    } else {
        key += "|" + config.interpreter;
        key += "|" + fs::absolute(config.preload_library).lexically_normal().string();
    }
    return key;
}

// ============================================================================
// RUNTIME PROBE
// ============================================================================

const std::string& RuntimeProbeScript() {
    static const std::string script = R"PY(
import importlib.util, json, os, site, sys, sysconfig
paths = {sys.prefix, sys.base_prefix, sys.exec_prefix, sys.base_exec_prefix}
paths.update(p for p in sys.path if p)
try:
    paths.update(site.getsitepackages())
except Exception:
    pass
try:
    paths.add(site.getusersitepackages())
except Exception:
    pass
paths.update(v for v in sysconfig.get_paths().values() if v)
paths.add(os.path.dirname(sys.executable))
paths.add(os.path.dirname(os.path.realpath(sys.executable)))
for name in ("sitecustomize", "usercustomize"):
    try:
        spec = importlib.util.find_spec(name)
    except Exception:
        spec = None
    if spec is not None and spec.origin:
        paths.add(os.path.dirname(os.path.realpath(spec.origin)))
print(json.dumps({
    "version": sys.version.split()[0],
    "executable": sys.executable,
    "paths": sorted(p for p in paths if os.path.isabs(p)),
}))
)PY";
    return script;
}

ExecutionImage ParseRuntimeProbe(const std::string& output) {
    auto lines = utils::StringUtils::Split(output, '\n', true);
    std::string last;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        auto trimmed = utils::StringUtils::Trim(*it);
        if (!trimmed.empty()) {
            last = trimmed;
            break;
        }
    }
    if (last.empty()) {
        throw ProvisioningError("runtime probe produced no output");
    }

    json j;
    try {
        j = json::parse(last);
    } catch (const json::parse_error& e) {
        throw ProvisioningError(std::string("runtime probe output is not JSON: ") + e.what());
    }
    if (!j.is_object() || !j.contains("paths") || !j["paths"].is_array()) {
        throw ProvisioningError("runtime probe output lacks a path list");
    }

    std::vector<fs::path> candidates;
    for (const auto& entry : j["paths"]) {
        if (!entry.is_string()) {
            continue;
        }
        fs::path path = StripTrailingSeparator(entry.get<std::string>());
        if (!path.is_absolute()) {
            continue;
        }
        if (path == path.root_path()) {
            spdlog::warn("Ignoring filesystem root reported by the runtime probe");
            continue;
        }
        candidates.push_back(path);
    }
    std::sort(candidates.begin(), candidates.end());

    ExecutionImage image;
    for (const auto& path : candidates) {
        bool covered = std::any_of(image.runtime_paths.begin(), image.runtime_paths.end(),
                                   [&](const fs::path& kept) {
                                       return ConfinementPolicy::IsUnder(path, kept);
                                   });
        if (!covered) {
            image.runtime_paths.push_back(path);
        }
    }
    if (image.runtime_paths.empty()) {
        throw ProvisioningError("runtime probe reported no installation directories");
    }

    image.runtime_version = j.value("version", "");
    image.interpreter = j.value("executable", "");
    return image;
}

// ============================================================================
// CONTAINER IMAGE
// ============================================================================

const std::vector<fs::path>& ContainerContextFiles() {
    static const std::vector<fs::path> files = {
        "docker/Dockerfile",
        "include/scriptjail/core/confinement_policy.hpp",
        "src/core/confinement_policy.cpp",
        "src/preload/open_interceptor.cpp",
    };
    return files;
}

ExecutionImage BuildContainerImage(const RunnerConfig& config) {
    if (!utils::ContainerUtils::IsRuntimeAvailable(config.docker_binary)) {
        throw ProvisioningError("container runtime '" + config.docker_binary + "' is not available");
    }
    utils::ContainerUtils docker(config.docker_binary);

    const fs::path context = fs::absolute(config.build_context_dir);
    StagingDirectory staging(fs::temp_directory_path() /
                             ("scriptjail_build_" + utils::StringUtils::RandomAlphanumeric(8)));

    // Dockerfile goes to the root of the staged context, sources keep their layout
    std::vector<fs::path> staged;
    for (const auto& relative : ContainerContextFiles()) {
        fs::path source = context / relative;
        if (!fs::is_regular_file(source)) {
            throw ProvisioningError("build context file missing: " + source.string());
        }
        fs::path target = relative.filename() == "Dockerfile"
                              ? staging.Path() / "Dockerfile"
                              : staging.Path() / relative;
        fs::create_directories(target.parent_path());
        fs::copy_file(source, target, fs::copy_options::overwrite_existing);
        staged.push_back(target);
    }

    const std::string digest = utils::HashUtils::ComputeTreeSHA256(staging.Path(), staged);
    const std::string tag = config.image_prefix + utils::StringUtils::RandomAlphanumeric(8);

    utils::ImageBuildOptions build;
    build.context_dir = staging.Path();
    build.tag = tag;
    build.labels[kContextDigestLabel] = digest;

    try {
        docker.BuildImage(build);
    } catch (const std::runtime_error& e) {
        throw ProvisioningError(e.what());
    }

    utils::ContainerConfig probe;
    probe.image = tag;
    probe.network_mode = utils::NetworkMode::NONE;
    probe.working_dir = "/";
    probe.command = {"python", "-c", RuntimeProbeScript()};

    auto result = docker.RunContainer(probe, std::chrono::duration_cast<std::chrono::milliseconds>(kProbeTimeout));
    if (!result.success) {
        docker.RemoveImage(tag, true);
        throw ProvisioningError("runtime probe in " + tag + " failed: " +
                                utils::StringUtils::Trim(result.stderr_output));
    }

    ExecutionImage image;
    try {
        image = ParseRuntimeProbe(result.stdout_output);
    } catch (const ProvisioningError&) {
        docker.RemoveImage(tag, true);
        throw;
    }

    image.kind = ImageKind::CONTAINER_IMAGE;
    image.id = tag;
    image.interpreter = "python";
    image.preload_library = kImagePreloadPath;
    image.context_digest = digest;

    spdlog::info("Built image {} (python {}, context {})", tag, image.runtime_version,
                 digest.substr(0, 12));
    return image;
}

// ============================================================================
// HOST INTERPRETER
// ============================================================================

ExecutionImage ProbeHostInterpreter(const RunnerConfig& config) {
    auto executable = utils::FindExecutable(config.interpreter);
    if (!executable) {
        throw ProvisioningError("interpreter '" + config.interpreter + "' not found");
    }

    fs::path preload = fs::absolute(config.preload_library);
    if (!fs::is_regular_file(preload)) {
        throw ProvisioningError("open interceptor not found at " + preload.string());
    }

    utils::ProcessOptions options;
    options.argv = {executable->string(), "-c", RuntimeProbeScript()};
    options.working_dir = "/";
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(kProbeTimeout);

    utils::ProcessResult result;
    try {
        result = utils::RunProcess(options);
    } catch (const std::system_error& e) {
        throw ProvisioningError(std::string("cannot run interpreter: ") + e.what());
    }
    if (!result.Succeeded()) {
        throw ProvisioningError("runtime probe of " + executable->string() + " failed: " +
                                utils::StringUtils::Trim(result.stderr_output));
    }

    ExecutionImage image = ParseRuntimeProbe(result.stdout_output);

    // The name found in PATH may be a launcher script (pyenv, asdf, conda)
    // that cannot read itself once confined; run the binary it resolved to
    fs::path reported = image.interpreter;
    if (reported.is_absolute() && ::access(reported.c_str(), X_OK) == 0) {
        if (reported != *executable) {
            spdlog::debug("Interpreter {} runs {}", executable->string(), reported.string());
        }
    } else {
        reported = *executable;
    }

    image.kind = ImageKind::HOST_INTERPRETER;
    image.id = reported.string();
    image.interpreter = reported.string();
    image.preload_library = preload;

    spdlog::info("Using host interpreter {} (python {}, {} runtime paths)", image.id,
                 image.runtime_version, image.runtime_paths.size());
    return image;
}

} // namespace core
} // namespace scriptjail
