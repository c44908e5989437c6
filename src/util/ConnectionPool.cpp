#include "util/ConnectionPool.hpp"
#include "util/Logger.hpp"
#include <exception>

namespace shairmeta::util {

ConnectionPool::ConnectionPool(size_t num_threads, size_t max_queue_size)
    : max_queue_size_(max_queue_size) {
    if (num_threads == 0) num_threads = 1;

    Logger::debug("ConnectionPool: Starting " + std::to_string(num_threads) + " worker threads");

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() {
            worker_thread();
        });
    }
}

ConnectionPool::~ConnectionPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    Logger::debug("ConnectionPool: Shutdown complete (" + std::to_string(rejected_.load()) +
                  " connection(s) rejected while full)");
}

bool ConnectionPool::submit_job(Job job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (stop_ || job_queue_.size() >= max_queue_size_) {
            rejected_.fetch_add(1);
            Logger::debug("ConnectionPool: " + std::to_string(active_.load()) + " busy, " +
                          std::to_string(job_queue_.size()) + " waiting, rejecting connection");
            return false;
        }

        job_queue_.push(std::move(job));
    }

    cv_.notify_one();
    return true;
}

size_t ConnectionPool::discard_pending() {
    std::queue<Job> dropped;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::swap(dropped, job_queue_);
    }
    // Jobs are destroyed here, outside the lock, releasing what they captured
    return dropped.size();
}

size_t ConnectionPool::get_queue_size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return job_queue_.size();
}

void ConnectionPool::worker_thread() {
    while (true) {
        Job job;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            cv_.wait(lock, [this]() {
                return stop_ || !job_queue_.empty();
            });

            if (stop_ && job_queue_.empty()) {
                break;
            }

            job = std::move(job_queue_.front());
            job_queue_.pop();
        }

        // Run outside the lock; one failing connection must not take the worker down
        active_.fetch_add(1);
        try {
            job();
        } catch (const std::exception& e) {
            Logger::error("ConnectionPool: Job failed: " + std::string(e.what()));
        }
        active_.fetch_sub(1);
    }
}

}  // namespace shairmeta::util
