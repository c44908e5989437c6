#include "events/Scheduler.hpp"
#include <algorithm>
#include <vector>

namespace shairmeta::events {

void Scheduler::schedule(const std::string& name, std::chrono::milliseconds interval, Task task,
                         Clock::time_point now) {
    tasks_[name] = {std::move(task), interval, now};
}

void Scheduler::unschedule(const std::string& name) {
    tasks_.erase(name);
}

void Scheduler::reset(const std::string& name, Clock::time_point now) {
    auto it = tasks_.find(name);
    if (it != tasks_.end()) {
        it->second.last_run = now;
    }
}

void Scheduler::process(Clock::time_point now) {
    // Collect first: a task may throw or unschedule itself
    std::vector<Task> due;
    for (auto& [name, task] : tasks_) {
        if (now - task.last_run >= task.interval) {
            task.last_run = now;
            due.push_back(task.task);
        }
    }
    for (const auto& task : due) {
        task();
    }
}

std::chrono::milliseconds Scheduler::time_until_next(std::chrono::milliseconds fallback,
                                                     Clock::time_point now) const {
    if (tasks_.empty()) return fallback;

    auto soonest = std::chrono::milliseconds::max();
    for (const auto& [name, task] : tasks_) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - task.last_run);
        auto remaining = task.interval - elapsed;
        soonest = std::min(soonest, std::max(remaining, std::chrono::milliseconds(0)));
    }
    return soonest;
}

}  // namespace shairmeta::events
