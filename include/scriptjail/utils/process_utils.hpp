/**
 * @file process_utils.hpp
 * @brief Child process execution with captured output
 *
 * Runs a program from an argv vector (no shell, no quoting) with an explicit
 * environment, captures stdout and stderr on separate pipes and reaps the
 * child on every exit path. With a deadline, the child's whole process group
 * is killed and reaped when the deadline passes.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <chrono>

namespace scriptjail {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief What to run and how
 */
struct ProcessOptions {
    std::vector<std::string> argv;                         ///< argv[0] is looked up in PATH
    std::optional<std::map<std::string, std::string>> env; ///< Full environment; inherit when unset
    std::filesystem::path working_dir;                     ///< Empty: inherit
    std::optional<std::chrono::milliseconds> timeout;      ///< Unset: wait indefinitely
    bool merge_stderr{false};                              ///< Send stderr to the stdout pipe
};

/**
 * @struct ProcessResult
 * @brief Outcome of one child process
 */
struct ProcessResult {
    int exit_code{0};                       ///< Exit status, 128+signal when killed
    std::string stdout_output;              ///< Captured standard output
    std::string stderr_output;              ///< Captured standard error
    bool timed_out{false};                  ///< Killed at the deadline
    std::chrono::milliseconds duration{0};  ///< Wall time

    bool Succeeded() const { return exit_code == 0 && !timed_out; }
};

/**
 * @brief Run a child process to completion
 *
 * The child runs in its own process group. Its stdin is /dev/null.
 *
 * @param options Program, environment, directory, deadline
 * @return Captured output and exit status
 *
 * @throws std::invalid_argument if argv is empty
 * @throws std::system_error if pipes cannot be created, fork fails, or the
 *         program cannot be executed (errno of the failed execvp)
 */
ProcessResult RunProcess(const ProcessOptions& options);

/**
 * @brief Snapshot of the calling process' environment
 */
std::map<std::string, std::string> CurrentEnvironment();

/**
 * @brief Locate an executable in PATH
 * @param name Program name; returned as-is when it contains a '/'
 * @return Absolute path, or nullopt when not found
 */
std::optional<std::filesystem::path> FindExecutable(const std::string& name);

} // namespace utils
} // namespace scriptjail
