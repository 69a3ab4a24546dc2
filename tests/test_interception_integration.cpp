/**
 * @file test_interception_integration.cpp
 * @brief End-to-end runs of real scripts with the host interpreter under the interceptor
 *
 * Skipped when python3 is not installed.
 */

#include "scriptjail/core/interception_backend.hpp"
#include "scriptjail/core/sandbox_runner.hpp"
#include "scriptjail/utils/process_utils.hpp"
#include "scriptjail/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace scriptjail;
using namespace scriptjail::core;
namespace fs = std::filesystem;

class InterceptionIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!utils::FindExecutable("python3")) {
            GTEST_SKIP() << "python3 not installed";
        }
        if (!fs::exists(SCRIPTJAIL_TEST_PRELOAD_PATH)) {
            GTEST_SKIP() << "preload library not built";
        }
        root_ = fs::canonical(fs::temp_directory_path()) /
                ("scriptjail_it_" + utils::StringUtils::RandomAlphanumeric(8));
        work_ = root_ / "work";
        fs::create_directories(root_);
    }

    void TearDown() override {
        ::unsetenv("ARTIFACT_DIR");
        std::error_code ec;
        if (!root_.empty()) {
            fs::remove_all(root_, ec);
        }
    }

    SandboxBuilder Builder() const {
        SandboxBuilder builder;
        builder.WithBackend(BackendKind::INTERCEPTION)
               .WithInterpreter("python3")
               .WithPreloadLibrary(SCRIPTJAIL_TEST_PRELOAD_PATH)
               .WithTimeout(std::chrono::seconds(60));
        return builder;
    }

    ExecutionResult Run(const std::string& script, EnvironmentMap extra_env = {}) {
        auto runner = Builder().Build();
        ExecutionRequest request;
        request.script = script;
        request.work_directory = work_;
        request.extra_env = std::move(extra_env);
        return runner.Run(request);
    }

    static std::string ReadFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    fs::path root_;
    fs::path work_;
};

// ============================================================================
// BASIC EXECUTION
// ============================================================================

TEST_F(InterceptionIntegrationTest, HelloWorld) {
    auto result = Run("print('Hello, World!')\n");

    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "Hello, World!\n");
    EXPECT_TRUE(result.stderr_output.empty()) << result.stderr_output;
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.backend, "interception");
}

TEST_F(InterceptionIntegrationTest, EmptyScriptSucceeds) {
    auto result = Run("");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_TRUE(result.stdout_output.empty());
}

TEST_F(InterceptionIntegrationTest, CallerVariablesAreVisible) {
    auto result = Run("import os\nprint(os.environ['TEST_VAR'])\n", {{"TEST_VAR", "test_value"}});
    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "test_value\n");
}

TEST_F(InterceptionIntegrationTest, CredentialsAreVisible) {
    auto runner = Builder().Build();
    ExecutionRequest request;
    request.script = "import os\nprint(os.environ['AWS_ACCESS_KEY_ID'], os.environ['AWS_SESSION_TOKEN'])\n";
    request.work_directory = work_;
    request.credentials.access_key = "AKIAEXAMPLE";
    request.credentials.secret_key = "secret";
    request.credentials.session_token = "token";

    auto result = runner.Run(request);
    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "AKIAEXAMPLE token\n");
}

TEST_F(InterceptionIntegrationTest, UndefinedNameFailsWithTraceback) {
    auto result = Run("print(undefined_name)\n");

    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.stderr_output.find("NameError"), std::string::npos) << result.stderr_output;
    EXPECT_NE(result.stderr_output.find("undefined_name"), std::string::npos);
}

// ============================================================================
// FILE CONFINEMENT
// ============================================================================

TEST_F(InterceptionIntegrationTest, WorkDirectoryIsWritable) {
    auto result = Run(
        "with open('output.txt', 'w') as f:\n"
        "    f.write('written by script')\n"
        "with open('output.txt') as f:\n"
        "    print(f.read())\n");

    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "written by script\n");
    EXPECT_EQ(ReadFile(work_ / "output.txt"), "written by script");
}

TEST_F(InterceptionIntegrationTest, ReadingOutsideTheWorkDirectoryIsDenied) {
    auto result = Run("print(open('/etc/passwd').read())\n");

    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.stderr_output.find("PermissionError"), std::string::npos) << result.stderr_output;
    EXPECT_NE(result.stderr_output.find("/etc/passwd"), std::string::npos);
    EXPECT_EQ(result.stdout_output.find("root:"), std::string::npos);
}

TEST_F(InterceptionIntegrationTest, DenialIsCatchable) {
    auto result = Run(
        "try:\n"
        "    open('/etc/passwd')\n"
        "except PermissionError as e:\n"
        "    print('denied', e.filename)\n");

    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "denied /etc/passwd\n");
}

TEST_F(InterceptionIntegrationTest, RuntimeFilesAreReadOnly) {
    auto result = Run(
        "import os\n"
        "try:\n"
        "    open(os.__file__, 'a')\n"
        "    print('writable')\n"
        "except PermissionError:\n"
        "    print('read-only')\n");

    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "read-only\n");
}

TEST_F(InterceptionIntegrationTest, SymlinkEscapeIsDenied) {
    fs::create_directories(work_);
    fs::create_directory_symlink("/etc", work_ / "etc-link");

    auto result = Run("print(open('etc-link/passwd').read())\n");
    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.stderr_output.find("PermissionError"), std::string::npos) << result.stderr_output;
}

TEST_F(InterceptionIntegrationTest, ChildProcessesAreConfined) {
    if (!utils::FindExecutable("cat")) {
        GTEST_SKIP() << "cat not available";
    }
    auto result = Run(
        "import subprocess\n"
        "r = subprocess.run(['cat', '/etc/passwd'], capture_output=True)\n"
        "print(r.returncode != 0, b'root:' in r.stdout)\n");

    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "True False\n");
}

TEST_F(InterceptionIntegrationTest, ExternalArtifactDirectoryIsShared) {
    auto artifacts = root_ / "artifacts";
    fs::create_directories(artifacts);
    std::ofstream(artifacts / "input.txt") << "from host";
    ::setenv("ARTIFACT_DIR", artifacts.c_str(), 1);

    auto result = Run(
        "import os\n"
        "d = os.environ['ARTIFACT_DIR']\n"
        "print(open(os.path.join(d, 'input.txt')).read())\n"
        "open(os.path.join(d, 'output.txt'), 'w').write('from script')\n");

    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "from host\n");
    EXPECT_EQ(ReadFile(artifacts / "output.txt"), "from script");
}

TEST_F(InterceptionIntegrationTest, ArtifactDirectoryDefaultsToWorkDirectory) {
    auto result = Run("import os\nprint(os.environ['ARTIFACT_DIR'])\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, work_.string() + "\n");
}

// ============================================================================
// LIFECYCLE
// ============================================================================

TEST_F(InterceptionIntegrationTest, TimeoutKillsScript) {
    auto runner = Builder().WithTimeout(std::chrono::milliseconds(500)).Build();
    ExecutionRequest request;
    request.script = "import time\nprint('started', flush=True)\ntime.sleep(30)\n";
    request.work_directory = work_;

    auto start = std::chrono::steady_clock::now();
    auto result = runner.Run(request);

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, kTimeoutExitCode);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(20));
    EXPECT_THROW(runner.RunChecked(request), ScriptFailedError);
}

TEST_F(InterceptionIntegrationTest, InterpreterIsProbedOnce) {
    auto config = Builder().BuildConfig();
    ImageCache::Instance().Clear();

    Run("print(1)\n");
    Run("print(2)\n");

    auto provisioner = ImageCache::Instance().Acquire(ImageCacheKey(config), [] {
        return ExecutionImage{};
    });
    EXPECT_EQ(provisioner->BuildCount(), 1u);
    ImageCache::Instance().Clear();
}

TEST_F(InterceptionIntegrationTest, LauncherScriptInterpreterRunsConfined) {
    auto python = utils::FindExecutable("python3");
    ASSERT_TRUE(python.has_value());

    auto launcher = root_ / "shims" / "python3";
    fs::create_directories(launcher.parent_path());
    std::ofstream(launcher) << "#!/bin/sh\nexec '" << python->string() << "' \"$@\"\n";
    fs::permissions(launcher, fs::perms::owner_all);

    auto runner = Builder().WithInterpreter(launcher.string()).Build();
    ExecutionRequest request;
    request.script = "print('Hello, World!')\n";
    request.work_directory = work_;

    auto result = runner.Run(request);
    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "Hello, World!\n");
    ImageCache::Instance().Clear();
}

TEST_F(InterceptionIntegrationTest, ScriptFileIsRemovedAfterRun) {
    Run("print('x')\n");
    EXPECT_FALSE(fs::exists(work_ / "script.py"));
}

// ============================================================================
// CHILD ENVIRONMENT
// ============================================================================

TEST(InterceptionEnvironmentTest, ConfinementVariablesCannotBeOverridden) {
    ExecutionImage image;
    image.preload_library = "/opt/lib/libscriptjail_preload.so";

    PreparedExecution execution;
    execution.host_work_directory = "/tmp/job";
    execution.sandbox_work_directory = "/tmp/job";
    execution.policy.Allow("/tmp/job", AccessMode::READ_WRITE);
    execution.environment = {
        {kPreloadEnvVar, "/tmp/evil.so"},
        {kPolicyEnvVar, "rw\t/\n"},
        {"TMPDIR", "/tmp/custom"},
    };

    auto env = InterceptionBackend::ChildEnvironment(image, execution);
    EXPECT_EQ(env.at(kPreloadEnvVar), "/opt/lib/libscriptjail_preload.so");
    EXPECT_EQ(env.at(kPolicyEnvVar), execution.policy.Serialize());
    EXPECT_EQ(env.at("TMPDIR"), "/tmp/custom");
    EXPECT_EQ(env.at("HOME"), "/tmp/job");
    EXPECT_EQ(env.count("PATH"), 1u);
    if (const char* path = std::getenv("PATH")) {
        EXPECT_EQ(env.at("PATH"), path);
    }
}
