/**
 * @file process.hpp
 * @brief Blocking shell command execution.
 */
#pragma once
#include "tddbatch/common/common.hpp"

namespace tddbatch
{

/**
 * @brief Outcome of a shell command.
 */
struct CommandResult
{
    int exit_code{-1};

    /// Combined stdout and stderr.
    std::string output;

    /// True when the command was killed by its deadline.
    bool timed_out{false};

    bool ok() const noexcept
    {
        return exit_code == 0 && !timed_out;
    }
};

/**
 * @brief Run `command` through `/bin/sh` and capture its output.
 *
 * @details
 * stderr is merged into stdout. With a timeout the command is wrapped in
 * `timeout(1)`, which terminates it (and kills it 5 seconds later if it is
 * still alive); exit status 124 is then reported as `timed_out`.
 *
 * @throws std::runtime_error if the shell cannot be started.
 */
CommandResult run_command(const std::string& command,
                          std::optional<std::chrono::seconds> timeout = std::nullopt);

/**
 * @brief Quote a string as a single POSIX shell word.
 */
std::string shell_quote(const std::string& text);

} // namespace tddbatch
