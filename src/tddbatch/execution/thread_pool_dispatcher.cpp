#include "tddbatch/execution/thread_pool_dispatcher.hpp"

#include <spdlog/spdlog.h>

namespace tddbatch
{

ThreadPoolDispatcher::ThreadPoolDispatcher(DispatcherConfig config)
    : Dispatcher(std::move(config))
{
    m_threads.reserve(m_config.thread_count);
    for (size_t i = 0; i < m_config.thread_count; ++i)
    {
        m_threads.emplace_back(&ThreadPoolDispatcher::worker_loop, this, i);
    }
    spdlog::debug("dispatcher started with {} worker thread(s)", m_config.thread_count);
}

ThreadPoolDispatcher::~ThreadPoolDispatcher()
{
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_shutdown = true;
    }
    m_job_available.notify_all();

    for (auto& thread : m_threads)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }
}

void ThreadPoolDispatcher::dispatch(std::vector<DispatchJob> jobs)
{
    if (jobs.empty())
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        for (auto& job : jobs)
        {
            m_queue.push(std::move(job));
        }
        m_outstanding += jobs.size();
    }
    m_job_available.notify_all();

    // Barrier
    {
        std::unique_lock<std::mutex> lock(m_queue_mutex);
        m_all_settled.wait(lock, [this] { return m_outstanding == 0; });
    }
    rethrow_captured();
}

void ThreadPoolDispatcher::worker_loop(size_t worker_index)
{
    spdlog::trace("dispatcher worker {} started", worker_index);

    while (true)
    {
        DispatchJob job;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_job_available.wait(lock, [this] { return !m_queue.empty() || m_shutdown; });
            if (m_shutdown && m_queue.empty())
            {
                break;
            }
            job = std::move(m_queue.front());
            m_queue.pop();
        }

        run_job(job);

        bool settled = false;
        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            settled = --m_outstanding == 0;
        }
        if (settled)
        {
            m_all_settled.notify_all();
        }
    }

    spdlog::trace("dispatcher worker {} stopped", worker_index);
}

} // namespace tddbatch
