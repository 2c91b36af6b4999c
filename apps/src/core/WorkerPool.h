#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace DiceTune {

/**
 * Resolve the worker count: a positive request is used as-is, otherwise the detected
 * core count minus the reserve (at least one worker).
 */
int resolveWorkerCount(int requested, int reservedCores);

/**
 * Fixed-size fork/join pool.
 *
 * run() submits a batch of independent tasks, blocks until every task of the batch has
 * finished, then rethrows the exception of the lowest-indexed failing task (if any).
 * Tasks of one batch must not share mutable targets; each task should write only into
 * its own result slot. run() is called from one thread at a time.
 */
class WorkerPool {
public:
    explicit WorkerPool(int workerCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    int workerCount() const { return static_cast<int>(workers_.size()); }

    void run(size_t taskCount, const std::function<void(size_t)>& task);

private:
    struct Batch {
        const std::function<void(size_t)>* task = nullptr;
        size_t remaining = 0;
        size_t failedIndex = 0;
        std::exception_ptr failure;
    };

    void workerLoop();

    std::vector<std::thread> workers_;
    std::mutex mutex_;
    std::condition_variable taskCv_;
    std::condition_variable doneCv_;
    std::deque<size_t> queue_;
    Batch batch_;
    bool stopRequested_ = false;
};

} // namespace DiceTune
