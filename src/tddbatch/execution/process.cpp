/**
 * @file process.cpp
 */
#include "tddbatch/execution/process.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace tddbatch
{

namespace
{

constexpr int k_timeout_exit_code = 124;
constexpr int k_killed_exit_code = 137;

} // namespace

std::string shell_quote(const std::string& text)
{
    std::string quoted = "'";
    for (char c : text)
    {
        if (c == '\'')
        {
            quoted += "'\\''";
        }
        else
        {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

CommandResult run_command(const std::string& command, std::optional<std::chrono::seconds> timeout)
{
    std::string full = command;
    if (timeout)
    {
        full = fmt::format("timeout --kill-after=5 {} /bin/sh -c {}",
                           timeout->count(), shell_quote(command));
    }
    full += " 2>&1";

    spdlog::trace("run: {}", full);
    FILE* pipe = popen(full.c_str(), "r");
    if (!pipe)
    {
        throw std::runtime_error("cannot start command: " + command);
    }

    CommandResult result;
    std::array<char, 4096> buffer;
    size_t n = 0;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0)
    {
        result.output.append(buffer.data(), n);
    }

    int status = pclose(pipe);
    if (status == -1)
    {
        throw std::runtime_error("cannot collect exit status of command: " + command);
    }
    if (WIFEXITED(status))
    {
        result.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (timeout && (result.exit_code == k_timeout_exit_code || result.exit_code == k_killed_exit_code))
    {
        result.timed_out = true;
    }
    return result;
}

} // namespace tddbatch
