/**
 * @file dispatcher.hpp
 * @brief IDispatcher interface and DispatcherConfig.
 */
#pragma once
#include "tddbatch/common/common.hpp"

namespace tddbatch
{

/**
 * @brief One unit of dispatch: the body of a batch.
 */
using DispatchJob = std::function<void()>;

/**
 * @brief Configuration for dispatcher behavior.
 */
struct DispatcherConfig
{
    /**
     * @brief Number of worker threads.
     * @details 0 means use std::thread::hardware_concurrency().
     *          1 means single-threaded execution.
     */
    size_t thread_count{1};
};

/**
 * @brief Interface for group dispatchers.
 *
 * @details
 * `dispatch()` is the group barrier: it starts every job and returns only
 * after all of them have finished. Jobs are started in the order given, so
 * a job may wait for work submitted before it without deadlocking even on a
 * single thread.
 *
 * @par Thread Safety
 * - dispatch() must be called from one thread at a time.
 * - Jobs run concurrently with each other on implementations with more than
 *   one thread.
 */
class IDispatcher
{
public:
    virtual ~IDispatcher() = default;

    /**
     * @brief Run all jobs and wait for them to settle.
     * @throws The first exception escaping a job, after every job finished.
     */
    virtual void dispatch(std::vector<DispatchJob> jobs) = 0;

    virtual size_t thread_count() const noexcept = 0;
};

using DispatcherPtr = std::shared_ptr<IDispatcher>;

/**
 * @brief Base class for dispatcher implementations.
 *
 * @details
 * Provides exception capture: a job that throws does not stop its siblings;
 * the first captured exception is rethrown once the barrier is reached.
 */
class Dispatcher : public IDispatcher
{
public:
    explicit Dispatcher(DispatcherConfig config);
    virtual ~Dispatcher() = default;

    size_t thread_count() const noexcept override
    {
        return m_config.thread_count;
    }

protected:
    /**
     * @brief Run one job, capturing any exception it throws.
     */
    void run_job(const DispatchJob& job);

    /**
     * @brief Rethrow and clear the first captured exception, if any.
     */
    void rethrow_captured();

    DispatcherConfig m_config;

private:
    std::mutex m_error_mutex;
    std::exception_ptr m_first_error{};
};

/**
 * @brief Create a dispatcher for the given thread count.
 * @details 1 gives a SingleThreadedDispatcher, anything else a
 *          ThreadPoolDispatcher.
 */
DispatcherPtr make_dispatcher(size_t thread_count);

} // namespace tddbatch
