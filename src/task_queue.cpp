#include "task_queue.hpp"
#include <iostream>
#include <utility>

namespace thai {

void TaskQueue::post(std::string label, Task task) {
    if (!task) return;
    tasks_.push_back(Entry{std::move(label), std::move(task)});
}

size_t TaskQueue::run_pending() {
    size_t ran = 0;
    while (!tasks_.empty()) {
        Entry entry = std::move(tasks_.front());
        tasks_.pop_front();
        ++ran;
        try {
            entry.task();
        } catch (const std::exception& e) {
            ++failed_;
            std::cerr << "Warning: Background task '" << entry.label << "' failed: " << e.what() << std::endl;
        }
    }
    return ran;
}

} // namespace thai
