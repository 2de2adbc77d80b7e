#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace spool::viewer
{

// Hand-off point between background threads and the UI thread. post() may be
// called from anywhere; drain() runs on the UI thread (the application idle
// hook) and is the only place posted work executes.
class UiQueue
{
public:
    using Task = std::function<void()>;

    void post(Task task);
    std::size_t drain();
    std::size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::deque<Task> tasks_;
};

} // namespace spool::viewer
