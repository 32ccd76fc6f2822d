#include "tddbatch/execution/dispatcher.hpp"
#include "tddbatch/execution/single_threaded_dispatcher.hpp"
#include "tddbatch/execution/thread_pool_dispatcher.hpp"

#include <thread>

namespace tddbatch
{

Dispatcher::Dispatcher(DispatcherConfig config)
    : m_config{std::move(config)}
{
    if (m_config.thread_count == 0)
    {
        m_config.thread_count = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
}

void Dispatcher::run_job(const DispatchJob& job)
{
    try
    {
        job();
    }
    catch (...)
    {
        std::lock_guard<std::mutex> lock(m_error_mutex);
        if (!m_first_error)
        {
            m_first_error = std::current_exception();
        }
    }
}

void Dispatcher::rethrow_captured()
{
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(m_error_mutex);
        std::swap(error, m_first_error);
    }
    if (error)
    {
        std::rethrow_exception(error);
    }
}

DispatcherPtr make_dispatcher(size_t thread_count)
{
    if (thread_count == 1)
    {
        return std::make_shared<SingleThreadedDispatcher>();
    }
    return std::make_shared<ThreadPoolDispatcher>(DispatcherConfig{thread_count});
}

} // namespace tddbatch
