/**
 * @file test_json_reporter.cpp
 * @brief JSON execution reports
 */

#include "scriptjail/reporters/json_reporter.hpp"
#include "scriptjail/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace scriptjail;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

core::ExecutionResult SampleResult() {
    core::ExecutionResult result;
    result.stdout_output = "Hello, World!\n";
    result.stderr_output = "warning\n";
    result.exit_code = 0;
    result.duration = std::chrono::milliseconds(1234);
    result.backend = "container";
    return result;
}

} // anonymous namespace

TEST(JsonReporterTest, ReportFields) {
    reporters::JsonReporter reporter;
    auto report = reporter.ToJson(SampleResult());

    EXPECT_EQ(report["schema"], reporters::kReportSchema);
    EXPECT_EQ(report["exit_code"], 0);
    EXPECT_EQ(report["succeeded"], true);
    EXPECT_EQ(report["timed_out"], false);
    EXPECT_EQ(report["duration_ms"], 1234);
    EXPECT_EQ(report["backend"], "container");
    EXPECT_EQ(report["stdout"], "Hello, World!\n");
    EXPECT_EQ(report["stderr"], "warning\n");
    EXPECT_FALSE(report.contains("metadata"));
    EXPECT_FALSE(report.contains("stdout_truncated"));
}

TEST(JsonReporterTest, TimedOutRunIsNotSuccessful) {
    auto result = SampleResult();
    result.timed_out = true;
    result.exit_code = core::kTimeoutExitCode;

    auto report = reporters::JsonReporter().ToJson(result);
    EXPECT_EQ(report["succeeded"], false);
    EXPECT_EQ(report["timed_out"], true);
    EXPECT_EQ(report["exit_code"], core::kTimeoutExitCode);
}

TEST(JsonReporterTest, Metadata) {
    reporters::ReportMetadata metadata;
    metadata.script_sha256 = "abc123";
    metadata.work_directory = "/tmp/job";
    metadata.image = "scriptjail_abcdefgh";
    metadata.generated_at = std::chrono::system_clock::time_point{};

    auto report = reporters::JsonReporter().ToJson(SampleResult(), metadata);
    ASSERT_TRUE(report.contains("metadata"));
    EXPECT_EQ(report["metadata"]["script_sha256"], "abc123");
    EXPECT_EQ(report["metadata"]["work_directory"], "/tmp/job");
    EXPECT_EQ(report["metadata"]["image"], "scriptjail_abcdefgh");
    EXPECT_EQ(report["metadata"]["generated_at"], "1970-01-01T00:00:00Z");
}

TEST(JsonReporterTest, OutputCanBeTruncatedOrOmitted) {
    reporters::JsonReporterConfig config;
    config.max_output_bytes = 5;
    auto clipped = reporters::JsonReporter(config).ToJson(SampleResult());
    EXPECT_EQ(clipped["stdout"], "Hello");
    EXPECT_EQ(clipped["stdout_truncated"], true);
    EXPECT_EQ(clipped["stderr"], "warni");

    config = {};
    config.include_output = false;
    auto bare = reporters::JsonReporter(config).ToJson(SampleResult());
    EXPECT_FALSE(bare.contains("stdout"));
    EXPECT_FALSE(bare.contains("stderr"));
}

TEST(JsonReporterTest, InvalidUtf8OutputStillSerializes) {
    auto result = SampleResult();
    result.stdout_output = std::string("bytes: \xff\xfe\n");

    reporters::JsonReporterConfig config;
    config.pretty_print = false;
    std::string text;
    ASSERT_NO_THROW(text = reporters::JsonReporter(config).GenerateJsonString(result));
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_NO_THROW(json::parse(text));
}

TEST(JsonReporterTest, FromJsonRestoresResult) {
    auto original = SampleResult();
    auto restored = reporters::JsonReporter::FromJson(reporters::JsonReporter().ToJson(original));

    EXPECT_EQ(restored.exit_code, original.exit_code);
    EXPECT_EQ(restored.stdout_output, original.stdout_output);
    EXPECT_EQ(restored.duration, original.duration);
    EXPECT_EQ(restored.backend, original.backend);

    EXPECT_THROW(reporters::JsonReporter::FromJson(json::array()), std::invalid_argument);
    EXPECT_THROW(reporters::JsonReporter::FromJson(json{{"exit_code", "zero"}}), std::invalid_argument);
    EXPECT_THROW(reporters::JsonReporter::FromJson(json{{"stdout", ""}}), std::invalid_argument);
}

TEST(JsonReporterTest, SaveReportCreatesParentDirectories) {
    auto root = fs::temp_directory_path() /
                ("scriptjail_report_" + utils::StringUtils::RandomAlphanumeric(8));
    auto path = root / "nested" / "report.json";

    reporters::JsonReporter reporter;
    ASSERT_TRUE(reporter.SaveReport(SampleResult(), path));

    std::ifstream in(path);
    auto report = json::parse(in);
    EXPECT_EQ(report["stdout"], "Hello, World!\n");

    // A directory cannot be overwritten by a report
    EXPECT_FALSE(reporter.SaveReport(SampleResult(), root / "nested"));

    std::error_code ec;
    fs::remove_all(root, ec);
}
