/**
 * @file process_runner.hpp
 * @brief Run an external command and capture its output.
 */
#pragma once
#include "deltatest/common/common.hpp"

namespace deltatest
{

/**
 * @brief Options for `run_process()`.
 */
struct ProcessOptions
{
    /// Working directory of the child; empty means the current directory.
    std::filesystem::path working_directory;

    /// If true, stderr goes to the same pipe as stdout and ends up in
    /// `ProcessResult::output`, interleaved as the child wrote it.
    bool merge_stderr = true;

    /// Called with each chunk of output as it arrives (live streaming).
    /// The chunk is still retained in the result.
    std::function<void(const std::string&)> on_output;
};

/**
 * @brief Result of a finished child process.
 */
struct ProcessResult
{
    /// Exit status, or `128 + signal` if the child was killed by a signal.
    int exit_code = -1;

    /// Captured stdout (and stderr when merged).
    std::string output;

    /// Captured stderr when it is not merged.
    std::string error_output;

    std::chrono::milliseconds duration{0};

    bool success() const noexcept
    {
        return exit_code == 0;
    }
};

/**
 * @brief Run a command and wait for it to exit.
 *
 * @details
 * The command is looked up on `PATH` (execvp). stdin is connected to
 * `/dev/null`. Both output streams are drained while the child runs, so a
 * chatty child never blocks on a full pipe.
 *
 * @param argv Program name followed by its arguments.
 * @param options See `ProcessOptions`.
 * @return Exit status and captured output. A nonzero exit is not an error.
 * @throw InvocationError with `SpawnFailed` if pipes or the child process
 *        cannot be created, `ExecFailed` if the program cannot be executed
 *        (not found, permission denied, bad working directory), or
 *        `IoFailed` if reading the output fails.
 */
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options = {});

/**
 * @brief Render an argument vector as a single shell-like line for messages.
 */
std::string format_command_line(const std::vector<std::string>& argv);

} // namespace deltatest
