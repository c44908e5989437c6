#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <cstdint>

namespace shairmeta::util {

// Fixed pool of worker threads serving accepted connections.
// Each job owns one connection and runs to completion on a worker.
class ConnectionPool {
public:
    using Job = std::function<void()>;

    ConnectionPool(size_t num_threads, size_t max_queue_size);

    // Destructor drains queued jobs, then joins the workers
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Submit a job (non-blocking)
    // Returns false if the queue is full; the caller still owns the connection
    [[nodiscard]] bool submit_job(Job job);

    // Drop every job not yet picked up by a worker; returns how many were dropped.
    // Running jobs are unaffected.
    size_t discard_pending();

    [[nodiscard]] size_t get_queue_size() const;
    [[nodiscard]] size_t get_thread_count() const { return workers_.size(); }
    [[nodiscard]] size_t get_active_count() const { return active_.load(); }
    [[nodiscard]] uint64_t get_rejected_count() const { return rejected_.load(); }

private:
    void worker_thread();

    std::vector<std::thread> workers_;

    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;

    std::atomic<bool> stop_{false};
    std::atomic<size_t> active_{0};      // Jobs running on a worker right now
    std::atomic<uint64_t> rejected_{0};
    size_t max_queue_size_;
};

}  // namespace shairmeta::util
