//! # Build Queue
//!
//! ```text
//! ParallelRunner::run()
//!   ├─ push every job onto the BuildQueue
//!   ├─ spawn min(threads, jobs) workers
//!   │    └─ worker_thread(): pop → run → record
//!   └─ join workers
//! ```

#include "build/build_queue.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <thread>
#include <vector>

namespace relpack::build {

// ============================================================================
// BuildQueue
// ============================================================================

void BuildQueue::push(std::shared_ptr<BuildJob> job) {
    std::lock_guard<std::mutex> lock(mutex);
    queue.push(std::move(job));
    cv.notify_one();
}

std::shared_ptr<BuildJob> BuildQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex);

    if (queue.empty() && !stop_flag) {
        cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                    [this] { return !queue.empty() || stop_flag; });
    }

    if (queue.empty() || stop_flag) {
        return nullptr;
    }

    auto job = queue.front();
    queue.pop();
    return job;
}

void BuildQueue::stop() {
    std::lock_guard<std::mutex> lock(mutex);
    stop_flag = true;
    cv.notify_all();
}

bool BuildQueue::is_stopped() {
    std::lock_guard<std::mutex> lock(mutex);
    return stop_flag;
}

bool BuildQueue::is_empty() {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.empty();
}

size_t BuildQueue::size() {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}

// ============================================================================
// ParallelRunner
// ============================================================================

ParallelRunner::ParallelRunner(int num_threads) : num_threads_(num_threads) {
    if (num_threads_ < 1)
        num_threads_ = 1;
}

bool ParallelRunner::run(std::vector<std::shared_ptr<BuildJob>>& jobs, const JobFn& fn,
                         bool fail_fast) {
    stats_.reset();
    stats_.total_jobs = static_cast<int>(jobs.size());
    abort_ = false;
    queue_ = std::make_unique<BuildQueue>();

    for (auto& job : jobs) {
        queue_->push(job);
    }

    int workers_needed = std::min<int>(num_threads_, static_cast<int>(jobs.size()));
    RELPACK_LOG_DEBUG("build", "Running " << jobs.size() << " jobs on " << workers_needed
                                          << " workers");

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(workers_needed));
    for (int i = 0; i < workers_needed; ++i) {
        workers.emplace_back(&ParallelRunner::worker_thread, this, std::cref(fn), fail_fast);
    }
    for (auto& worker : workers) {
        worker.join();
    }

    // Anything left behind after a fail-fast stop never ran.
    for (auto& job : jobs) {
        if (!job->completed && !job->failed)
            job->skipped = true;
    }

    RELPACK_LOG_DEBUG("build", "Jobs finished: " << stats_.completed.load() << " ok, " << stats_.failed.load()
                                                 << " failed in " << stats_.elapsed_ms() << "ms");
    return stats_.failed == 0 && stats_.completed == stats_.total_jobs;
}

void ParallelRunner::worker_thread(const JobFn& fn, bool fail_fast) {
    while (true) {
        auto job = queue_->pop(100);
        if (!job) {
            if (queue_->is_stopped() || queue_->is_empty())
                break;
            continue;
        }

        if (fail_fast && abort_) {
            continue;
        }

        if (fn(*job)) {
            job->completed = true;
            stats_.completed++;
        } else {
            job->failed = true;
            stats_.failed++;
            if (fail_fast) {
                abort_ = true;
                queue_->stop();
            }
        }
    }
}

} // namespace relpack::build
