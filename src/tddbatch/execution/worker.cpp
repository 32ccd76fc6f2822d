/**
 * @file worker.cpp
 */
#include "tddbatch/execution/worker.hpp"
#include "tddbatch/execution/process.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <sstream>

namespace tddbatch
{

namespace
{

const std::string k_touched_prefix = "TDDBATCH_TOUCHED ";

} // namespace

WorkerResult parse_worker_output(const std::string& output, bool success)
{
    WorkerResult result;
    result.success = success;

    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line))
    {
        if (line.compare(0, k_touched_prefix.size(), k_touched_prefix) == 0)
        {
            std::string path = line.substr(k_touched_prefix.size());
            while (!path.empty() && (path.back() == '\r' || path.back() == ' '))
            {
                path.pop_back();
            }
            if (!path.empty() &&
                std::find(result.touched_paths.begin(), result.touched_paths.end(), path) ==
                    result.touched_paths.end())
            {
                result.touched_paths.push_back(path);
            }
            continue;
        }
        result.evidence += line;
        result.evidence += '\n';
    }
    return result;
}

CommandWorker::CommandWorker(std::string command, std::string working_directory)
    : m_command{std::move(command)}
    , m_working_directory{std::move(working_directory)}
{
    if (m_command.empty())
    {
        throw std::invalid_argument("CommandWorker requires a command");
    }
}

WorkerResult CommandWorker::execute(const Task& task, std::chrono::seconds deadline)
{
    const std::string command = fmt::format(
        "cd {} && TDDBATCH_TASK_ID={} TDDBATCH_TASK_PHASE={} TDDBATCH_TASK_DOMAIN={} "
        "TDDBATCH_TASK_DESCRIPTION={} TDDBATCH_TASK_PREDECESSOR={} /bin/sh -c {}",
        shell_quote(m_working_directory),
        shell_quote(task.id),
        shell_quote(to_string(task.phase)),
        shell_quote(to_string(task.domain)),
        shell_quote(task.description),
        shell_quote(task.predecessor.value_or("")),
        shell_quote(m_command));

    spdlog::debug("worker command for {}: {}", task.id, m_command);
    CommandResult run = run_command(command, deadline);

    WorkerResult result = parse_worker_output(run.output, run.ok());
    if (run.timed_out)
    {
        result.evidence += fmt::format("worker exceeded deadline of {}s\n", deadline.count());
    }
    else if (!run.ok())
    {
        result.evidence += fmt::format("worker exited with status {}\n", run.exit_code);
    }
    return result;
}

} // namespace tddbatch
