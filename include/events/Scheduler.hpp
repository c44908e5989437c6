#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

namespace shairmeta::events {

// Named periodic tasks driven by an external loop (no thread of its own).
// The owner calls process() after each poll() and sizes the poll timeout
// with time_until_next().
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    void schedule(const std::string& name, std::chrono::milliseconds interval, Task task,
                  Clock::time_point now = Clock::now());
    void unschedule(const std::string& name);

    // Restart the interval of `name` from `now`
    void reset(const std::string& name, Clock::time_point now = Clock::now());

    // Run every task whose interval has elapsed
    void process(Clock::time_point now = Clock::now());

    // Zero when a task is overdue, `fallback` when nothing is scheduled
    [[nodiscard]] std::chrono::milliseconds time_until_next(std::chrono::milliseconds fallback,
                                                            Clock::time_point now = Clock::now()) const;

    [[nodiscard]] size_t size() const { return tasks_.size(); }

private:
    struct ScheduledTask {
        Task task;
        std::chrono::milliseconds interval;
        Clock::time_point last_run;
    };

    std::map<std::string, ScheduledTask> tasks_;
};

}  // namespace shairmeta::events
