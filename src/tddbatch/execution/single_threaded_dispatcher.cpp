#include "tddbatch/execution/single_threaded_dispatcher.hpp"

namespace tddbatch
{

SingleThreadedDispatcher::SingleThreadedDispatcher(DispatcherConfig /*config*/)
    : Dispatcher(DispatcherConfig{1})
{
}

void SingleThreadedDispatcher::dispatch(std::vector<DispatchJob> jobs)
{
    for (const auto& job : jobs)
    {
        run_job(job);
    }
    rethrow_captured();
}

} // namespace tddbatch
