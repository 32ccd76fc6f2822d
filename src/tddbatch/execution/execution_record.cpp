/**
 * @file execution_record.cpp
 */
#include "tddbatch/execution/execution_record.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>

namespace tddbatch
{

const char* to_string(TaskStatus status) noexcept
{
    switch (status)
    {
        case TaskStatus::Pending:
            return "pending";
        case TaskStatus::InProgress:
            return "in-progress";
        case TaskStatus::Completed:
            return "completed";
        case TaskStatus::Failed:
            return "failed";
        case TaskStatus::Blocked:
            return "blocked";
    }
    return "unknown";
}

std::optional<TaskStatus> task_status_from_string(const std::string& name)
{
    for (TaskStatus status : {TaskStatus::Pending,
                              TaskStatus::InProgress,
                              TaskStatus::Completed,
                              TaskStatus::Failed,
                              TaskStatus::Blocked})
    {
        if (name == to_string(status))
        {
            return status;
        }
    }
    return std::nullopt;
}

int64_t to_epoch_millis(Timestamp timestamp) noexcept
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

Timestamp from_epoch_millis(int64_t millis) noexcept
{
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis))};
}

std::string format_timestamp(Timestamp timestamp)
{
    const int64_t millis = to_epoch_millis(timestamp);
    const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", utc, static_cast<int>(millis % 1000));
}

} // namespace tddbatch
