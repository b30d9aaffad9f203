#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace sqlmcp {

/**
 * @brief Fixed set of worker threads fed by a bounded FIFO queue
 *
 * try_submit never blocks: when max_queue tasks are already waiting the
 * task is refused and the caller answers "server busy". A slow request
 * therefore occupies one worker, never the reader.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(size_t workers, size_t max_queue);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Returns false when the queue is full or the pool stopped.
    [[nodiscard]] bool try_submit(Task task);

    /**
     * @brief Stop accepting tasks and join the workers
     * @param run_pending Run tasks still queued (true) or drop them (false)
     */
    void shutdown(bool run_pending = true);

    [[nodiscard]] size_t queued() const;
    [[nodiscard]] size_t worker_count() const { return workers_.size(); }

private:
    void worker_loop();

    const size_t max_queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    bool stopping_ = false;
    std::vector<std::jthread> workers_;
};

} // namespace sqlmcp
