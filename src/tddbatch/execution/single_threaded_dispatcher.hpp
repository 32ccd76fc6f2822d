/**
 * @file single_threaded_dispatcher.hpp
 * @brief SingleThreadedDispatcher for sequential batch execution.
 */
#pragma once
#include "tddbatch/execution/dispatcher.hpp"

namespace tddbatch
{

/**
 * @brief Single-threaded dispatcher for debugging and testing.
 *
 * @details
 * Runs the jobs one after another on the calling thread. Useful as a
 * reference for the pooled dispatcher and for reproducing a run without
 * thread interleaving.
 */
class SingleThreadedDispatcher : public Dispatcher
{
public:
    /**
     * @param config Configuration (thread_count ignored, always 1).
     */
    explicit SingleThreadedDispatcher(DispatcherConfig config = {});

    void dispatch(std::vector<DispatchJob> jobs) override;
};

} // namespace tddbatch
