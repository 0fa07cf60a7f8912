#pragma once

#include <deque>
#include <functional>
#include <string>

namespace thai {

// Cooperative queue for fire-and-forget work (cache hydration, persistence,
// hint fetches). Nothing runs until the host calls run_pending(), so a task
// posted during a segmentation call is only observable on a later call.
class TaskQueue {
public:
    using Task = std::function<void()>;

    void post(std::string label, Task task);

    // Runs tasks FIFO until the queue is empty, including tasks posted by
    // running tasks. A task that throws is logged and dropped. Returns the
    // number of tasks run.
    size_t run_pending();

    size_t pending() const { return tasks_.size(); }
    size_t failed() const { return failed_; }

private:
    struct Entry {
        std::string label;
        Task task;
    };

    std::deque<Entry> tasks_;
    size_t failed_ = 0;
};

} // namespace thai
