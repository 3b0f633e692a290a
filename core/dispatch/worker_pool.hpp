#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace aim {

/// Queue position of a job: higher rank first, then lower sequence.
struct JobPriority {
    int rank = 0;
    uint64_t sequence = 0;
};

// ─── Worker Pool ───────────────────────────────────────────────
// Fixed number of native threads executing queued jobs in priority
// order. Jobs beyond the pool size wait in the queue. A job must not
// throw; the pool logs and drops anything that escapes.

class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a job. Returns false once the pool is shut down.
    bool submit(JobPriority priority, Job job);

    /// Stop accepting jobs, discard queued ones, wait for running ones.
    /// Returns the number of discarded jobs.
    size_t shutdown();

    size_t size() const { return threads_.size(); }
    size_t pendingCount() const;
    size_t runningCount() const { return running_.load(); }

private:
    struct QueuedJob {
        JobPriority priority;
        Job job;
    };

    struct LowerPriority {
        bool operator()(const QueuedJob& a, const QueuedJob& b) const {
            if (a.priority.rank != b.priority.rank) return a.priority.rank < b.priority.rank;
            return a.priority.sequence > b.priority.sequence;
        }
    };

    void workerLoop();

    std::vector<std::thread> threads_;
    std::priority_queue<QueuedJob, std::vector<QueuedJob>, LowerPriority> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::atomic<size_t> running_{0};
};

} // namespace aim
