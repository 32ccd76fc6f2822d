/**
 * @file thread_pool_dispatcher.hpp
 * @brief ThreadPoolDispatcher: a fixed pool of worker threads.
 */
#pragma once
#include "tddbatch/execution/dispatcher.hpp"

#include <condition_variable>
#include <queue>
#include <thread>

namespace tddbatch
{

/**
 * @brief Dispatcher backed by a fixed pool of threads.
 *
 * @details
 * Threads are started on construction and joined on destruction. Jobs are
 * taken from a FIFO queue, so a job never waits on a job queued behind it.
 *
 * @par Thread Safety
 * - dispatch() must be called from one thread at a time.
 */
class ThreadPoolDispatcher : public Dispatcher
{
public:
    explicit ThreadPoolDispatcher(DispatcherConfig config);
    ~ThreadPoolDispatcher() override;

    ThreadPoolDispatcher(const ThreadPoolDispatcher&) = delete;
    ThreadPoolDispatcher& operator=(const ThreadPoolDispatcher&) = delete;

    void dispatch(std::vector<DispatchJob> jobs) override;

private:
    void worker_loop(size_t worker_index);

    std::mutex m_queue_mutex;
    std::condition_variable m_job_available;
    std::condition_variable m_all_settled;
    std::queue<DispatchJob> m_queue;
    size_t m_outstanding{0};
    bool m_shutdown{false};

    std::vector<std::thread> m_threads;
};

} // namespace tddbatch
