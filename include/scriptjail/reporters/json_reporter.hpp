/**
 * @file json_reporter.hpp
 * @brief Machine-readable execution reports
 *
 * Turns an ExecutionResult (plus optional run metadata) into JSON for the
 * caller layer, and reads such reports back. Reports never contain the
 * script's environment or credentials.
 *
 * **Report layout**:
 * @code{.json}
 * {
 *   "schema": "scriptjail.execution/1",
 *   "exit_code": 0,
 *   "succeeded": true,
 *   "timed_out": false,
 *   "duration_ms": 412,
 *   "backend": "container",
 *   "stdout": "hello\n",
 *   "stderr": "",
 *   "metadata": {"script_sha256": "...", "work_directory": "/tmp/job-1",
 *                "image": "scriptjail_ab12cd34", "generated_at": "2025-01-01T00:00:00Z"}
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "scriptjail/core/execution_types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <optional>
#include <filesystem>
#include <chrono>

namespace scriptjail {
namespace reporters {

/// Value of the "schema" field
constexpr const char* kReportSchema = "scriptjail.execution/1";

/**
 * @struct JsonReporterConfig
 * @brief Configuration for JSON report generation
 */
struct JsonReporterConfig {
    bool pretty_print{true};          ///< Pretty print JSON
    int indent_size{2};               ///< Indentation spaces
    bool include_output{true};        ///< Include stdout/stderr text
    std::size_t max_output_bytes{0};  ///< Truncate each stream to this size (0 = unlimited)
};

/**
 * @struct ReportMetadata
 * @brief Optional context of a run
 */
struct ReportMetadata {
    std::string script_sha256;                   ///< Digest of the executed script
    std::filesystem::path work_directory;        ///< Host work directory
    std::string image;                           ///< Execution image id
    std::chrono::system_clock::time_point generated_at{std::chrono::system_clock::now()};
};

/**
 * @class JsonReporter
 * @brief ExecutionResult <-> JSON
 */
class JsonReporter {
public:
    explicit JsonReporter(JsonReporterConfig config = {});

    /// Report object for a result
    nlohmann::json ToJson(const core::ExecutionResult& result,
                          const std::optional<ReportMetadata>& metadata = std::nullopt) const;

    /// Serialized report, formatted per configuration
    std::string GenerateJsonString(const core::ExecutionResult& result,
                                   const std::optional<ReportMetadata>& metadata = std::nullopt) const;

    /**
     * @brief Write a report file, creating parent directories
     * @return true if the file was written
     */
    bool SaveReport(const core::ExecutionResult& result,
                    const std::filesystem::path& output_path,
                    const std::optional<ReportMetadata>& metadata = std::nullopt) const;

    /**
     * @brief Rebuild a result from a report object
     * @throws std::invalid_argument on a missing or mistyped field
     */
    static core::ExecutionResult FromJson(const nlohmann::json& report);

private:
    JsonReporterConfig config_;

    std::string Clip(const std::string& text, bool& truncated) const;
};

/// ISO 8601 UTC timestamp ("2025-01-01T00:00:00Z")
std::string FormatTimestamp(std::chrono::system_clock::time_point time);

} // namespace reporters
} // namespace scriptjail
