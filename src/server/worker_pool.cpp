#include "server/worker_pool.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlmcp {

WorkerPool::WorkerPool(size_t workers, size_t max_queue)
    : max_queue_(max_queue) {
    const size_t n = workers > 0 ? workers : 1;
    workers_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown(false);
}

bool WorkerPool::try_submit(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_ || queue_.size() >= max_queue_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown(bool run_pending) {
    std::deque<Task> dropped;
    {
        std::lock_guard lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        if (!run_pending) {
            dropped.swap(queue_);
        }
    }
    cv_.notify_all();

    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();

    if (!dropped.empty()) {
        utils::log::warn(std::format("Dropped {} queued requests at shutdown", dropped.size()));
    }
}

size_t WorkerPool::queued() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            utils::log::error(std::format("Worker task failed: {}", e.what()));
        }
    }
}

} // namespace sqlmcp
