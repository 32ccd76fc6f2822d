/**
 * @file run_report.cpp
 */
#include "tddbatch/execution/run_report.hpp"

#include <fmt/format.h>

namespace tddbatch
{

namespace
{

void append_list(std::string& out, const char* label, const std::vector<TaskId>& ids)
{
    if (ids.empty())
    {
        return;
    }
    out += fmt::format("{:<10} {}\n", label, join_ids(ids));
}

} // namespace

std::string format_report(const RunReport& report)
{
    std::string out = report.summary() + "\n";
    if (report.aborted)
    {
        out += "abort reason: " + report.abort_reason + "\n";
    }

    append_list(out, "completed", report.completed);
    append_list(out, "skipped", report.skipped);
    append_list(out, "failed", report.failed);
    append_list(out, "blocked", report.blocked);
    append_list(out, "not run", report.not_run);

    for (const auto& checkpoint : report.checkpoints)
    {
        out += fmt::format("checkpoint group {} {} ({})\n",
                           checkpoint.group_index,
                           checkpoint.commit_ref,
                           join_ids(checkpoint.task_ids));
    }
    for (const auto& entry : report.failures)
    {
        out += fmt::format("failure {} {}: {}\n",
                           format_timestamp(entry.timestamp), entry.task_id, entry.reason);
    }
    return out;
}

} // namespace tddbatch
