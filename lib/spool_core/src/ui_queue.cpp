#include "spool/viewer/ui_queue.hpp"

namespace spool::viewer
{

void UiQueue::post(Task task)
{
    if (!task)
        return;
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
}

std::size_t UiQueue::drain()
{
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(tasks_);
    }

    // Work posted while draining waits for the next pass.
    std::size_t executed = 0;
    while (!batch.empty())
    {
        Task task = std::move(batch.front());
        batch.pop_front();
        try
        {
            task();
        }
        catch (...)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = batch.rbegin(); it != batch.rend(); ++it)
                tasks_.push_front(std::move(*it));
            throw;
        }
        ++executed;
    }
    return executed;
}

std::size_t UiQueue::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace spool::viewer
