//! # Build Queue
//!
//! Bounded worker pool used to run architecture builds concurrently. Each
//! architecture is an independent job; there are no dependencies between
//! jobs, so a plain FIFO queue is enough.
//!
//! ## Thread Safety
//!
//! | Component    | Synchronization            |
//! |--------------|----------------------------|
//! | BuildQueue   | Mutex + condition variable |
//! | BuildStats   | Atomic counters            |
//! | Job results  | One slot per job           |

#ifndef RELPACK_BUILD_BUILD_QUEUE_HPP
#define RELPACK_BUILD_BUILD_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace relpack::build {

/// One unit of work: an index into the caller's job list.
struct BuildJob {
    size_t index = 0;
    std::string label;
    bool completed = false;
    bool failed = false;
    bool skipped = false; ///< Never started because another job failed first
};

struct BuildStats {
    std::atomic<int> total_jobs{0};
    std::atomic<int> completed{0};
    std::atomic<int> failed{0};
    std::chrono::steady_clock::time_point start_time;

    void reset() {
        total_jobs = 0;
        completed = 0;
        failed = 0;
        start_time = std::chrono::steady_clock::now();
    }

    int64_t elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time).count();
    }
};

/// Thread-safe work queue.
class BuildQueue {
public:
    BuildQueue() : stop_flag(false) {}

    void push(std::shared_ptr<BuildJob> job);

    /// Pops a job, waiting up to `timeout_ms`. Returns nullptr if the queue is
    /// still empty afterwards or the queue was stopped.
    std::shared_ptr<BuildJob> pop(int timeout_ms = 100);

    void stop();
    bool is_stopped();
    bool is_empty();
    size_t size();

private:
    std::queue<std::shared_ptr<BuildJob>> queue;
    std::mutex mutex;
    std::condition_variable cv;
    bool stop_flag;
};

/// Runs jobs through a fixed number of worker threads.
class ParallelRunner {
public:
    using JobFn = std::function<bool(BuildJob&)>;

    explicit ParallelRunner(int num_threads);

    /// Returns true if `fn` succeeded for every job. With `fail_fast`, jobs
    /// not yet started when one fails are skipped.
    bool run(std::vector<std::shared_ptr<BuildJob>>& jobs, const JobFn& fn, bool fail_fast = true);

    const BuildStats& stats() const {
        return stats_;
    }

private:
    int num_threads_;
    std::unique_ptr<BuildQueue> queue_;
    BuildStats stats_;
    std::atomic<bool> abort_{false};

    void worker_thread(const JobFn& fn, bool fail_fast);
};

} // namespace relpack::build

#endif // RELPACK_BUILD_BUILD_QUEUE_HPP
