/**
 * @file json_reporter.cpp
 * @brief Implementation of JSON execution reports
 *
 * @date 2025
 */

#include "scriptjail/reporters/json_reporter.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace scriptjail {
namespace reporters {

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

JsonReporter::JsonReporter(JsonReporterConfig config)
    : config_(config) {}

std::string JsonReporter::Clip(const std::string& text, bool& truncated) const {
    truncated = config_.max_output_bytes > 0 && text.size() > config_.max_output_bytes;
    return truncated ? text.substr(0, config_.max_output_bytes) : text;
}

// ============================================================================
// JSON GENERATION
// ============================================================================

json JsonReporter::ToJson(const core::ExecutionResult& result,
                          const std::optional<ReportMetadata>& metadata) const {
    json report;
    report["schema"] = kReportSchema;
    report["exit_code"] = result.exit_code;
    report["succeeded"] = result.Succeeded();
    report["timed_out"] = result.timed_out;
    report["duration_ms"] = result.duration.count();
    report["backend"] = result.backend;

    if (config_.include_output) {
        bool truncated = false;
        // Script output may be arbitrary bytes; replace invalid UTF-8 on dump
        report["stdout"] = Clip(result.stdout_output, truncated);
        if (truncated) report["stdout_truncated"] = true;
        report["stderr"] = Clip(result.stderr_output, truncated);
        if (truncated) report["stderr_truncated"] = true;
    }

    if (metadata) {
        json meta;
        if (!metadata->script_sha256.empty()) meta["script_sha256"] = metadata->script_sha256;
        if (!metadata->work_directory.empty()) meta["work_directory"] = metadata->work_directory.string();
        if (!metadata->image.empty()) meta["image"] = metadata->image;
        meta["generated_at"] = FormatTimestamp(metadata->generated_at);
        report["metadata"] = meta;
    }

    return report;
}

std::string JsonReporter::GenerateJsonString(const core::ExecutionResult& result,
                                             const std::optional<ReportMetadata>& metadata) const {
    auto report = ToJson(result, metadata);
    const int indent = config_.pretty_print ? config_.indent_size : -1;
    return report.dump(indent, ' ', false, json::error_handler_t::replace);
}

bool JsonReporter::SaveReport(const core::ExecutionResult& result,
                              const std::filesystem::path& output_path,
                              const std::optional<ReportMetadata>& metadata) const {
    try {
        if (output_path.has_parent_path()) {
            std::filesystem::create_directories(output_path.parent_path());
        }

        std::ofstream file(output_path, std::ios::trunc);
        if (!file.is_open()) {
            spdlog::error("Failed to open report file: {}", output_path.string());
            return false;
        }
        file << GenerateJsonString(result, metadata) << '\n';
        if (!file) {
            spdlog::error("Failed to write report file: {}", output_path.string());
            return false;
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to save report {}: {}", output_path.string(), e.what());
        return false;
    }

    spdlog::info("Report saved: {}", output_path.string());
    return true;
}

// ============================================================================
// JSON PARSING
// ============================================================================

core::ExecutionResult JsonReporter::FromJson(const json& report) {
    if (!report.is_object()) {
        throw std::invalid_argument("report is not a JSON object");
    }
    if (!report.contains("exit_code") || !report["exit_code"].is_number_integer()) {
        throw std::invalid_argument("report lacks an integer exit_code");
    }

    core::ExecutionResult result;
    try {
        result.exit_code = report["exit_code"].get<int>();
        result.timed_out = report.value("timed_out", false);
        result.duration = std::chrono::milliseconds(report.value("duration_ms", 0LL));
        result.backend = report.value("backend", "");
        result.stdout_output = report.value("stdout", "");
        result.stderr_output = report.value("stderr", "");
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("malformed report: ") + e.what());
    }
    return result;
}

} // namespace reporters
} // namespace scriptjail
