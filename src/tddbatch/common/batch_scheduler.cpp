/**
 * @file batch_scheduler.cpp
 */
#include "tddbatch/common/batch_scheduler.hpp"
#include "tddbatch/common/scheduler_errors.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace tddbatch
{

const char* to_string(BatchMode mode) noexcept
{
    switch (mode)
    {
        case BatchMode::Sequential:
            return "sequential";
        case BatchMode::Parallel:
            return "parallel";
    }
    return "unknown";
}

BatchScheduler::BatchScheduler(size_t max_batch_size, size_t max_group_size)
    : m_max_batch_size{max_batch_size}
    , m_max_group_size{max_group_size}
{
    if (m_max_batch_size == 0)
    {
        throw ConfigError("max_batch_size must be at least 1");
    }
    if (m_max_group_size == 0)
    {
        throw ConfigError("max_group_size must be at least 1");
    }
}

std::vector<Batch> BatchScheduler::make_batches(const TaskList& tasks) const
{
    std::vector<Batch> batches;
    Batch accumulator;

    auto flush = [&]()
    {
        if (!accumulator.tasks.empty())
        {
            accumulator.mode = BatchMode::Parallel;
            batches.push_back(std::move(accumulator));
            accumulator = Batch{};
        }
    };

    for (const auto& task : tasks)
    {
        if (task.is_phase_bound())
        {
            flush();
            Batch single;
            single.tasks.push_back(task);
            single.mode = BatchMode::Sequential;
            batches.push_back(std::move(single));
            continue;
        }

        const bool fits = accumulator.tasks.empty() ||
                          (accumulator.tasks.front().domain == task.domain &&
                           accumulator.tasks.size() < m_max_batch_size);
        if (!fits)
        {
            flush();
        }
        accumulator.tasks.push_back(task);
    }
    flush();

    return batches;
}

std::vector<Group> BatchScheduler::make_groups(std::vector<Batch> batches) const
{
    std::vector<Group> groups;
    for (size_t i = 0; i < batches.size(); ++i)
    {
        if (i % m_max_group_size == 0)
        {
            Group group;
            group.index = groups.size();
            groups.push_back(std::move(group));
        }
        groups.back().batches.push_back(std::move(batches[i]));
    }
    return groups;
}

std::vector<Group> BatchScheduler::schedule(const TaskList& tasks) const
{
    auto batches = make_batches(tasks);
    const size_t batch_count = batches.size();
    auto groups = make_groups(std::move(batches));
    spdlog::info("scheduled {} task(s) into {} batch(es) and {} group(s)",
                 tasks.size(), batch_count, groups.size());
    return groups;
}

std::string describe_plan(const std::vector<Group>& groups)
{
    std::ostringstream oss;
    for (const auto& group : groups)
    {
        oss << "group " << group.index << "\n";
        for (const auto& batch : group.batches)
        {
            oss << "  batch [" << to_string(batch.mode) << "]";
            for (const auto& task : batch.tasks)
            {
                oss << " " << task.id;
            }
            if (batch.mode == BatchMode::Parallel)
            {
                oss << " (" << to_string(batch.tasks.front().domain) << ")";
            }
            else
            {
                oss << " (" << to_string(batch.tasks.front().phase) << ")";
            }
            oss << "\n";
        }
    }
    return oss.str();
}

} // namespace tddbatch
