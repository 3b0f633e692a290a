#include "dispatch/worker_pool.hpp"
#include "common/logging.hpp"

namespace aim {

WorkerPool::WorkerPool(size_t workers) {
    if (workers == 0) workers = 1;
    threads_.reserve(workers);
    for (size_t i = 0; i < workers; i++) {
        threads_.emplace_back([this] { workerLoop(); });
    }
    logger()->info("Worker pool started with {} workers", workers);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(JobPriority priority, Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        queue_.push(QueuedJob{priority, std::move(job)});
    }
    cv_.notify_one();
    return true;
}

size_t WorkerPool::shutdown() {
    size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && threads_.empty()) return 0;
        stopping_ = true;
        discarded = queue_.size();
        while (!queue_.empty()) queue_.pop();
    }
    cv_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    if (!threads_.empty()) {
        logger()->info("Worker pool stopped ({} queued jobs discarded)", discarded);
    }
    threads_.clear();
    return discarded;
}

size_t WorkerPool::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void WorkerPool::workerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) return;
            job = queue_.top().job;
            queue_.pop();
            running_++;
        }

        try {
            job();
        } catch (const std::exception& e) {
            logger()->error("Worker job raised an exception: {}", e.what());
        } catch (...) {
            logger()->error("Worker job raised a non-standard exception");
        }
        running_--;
    }
}

} // namespace aim
