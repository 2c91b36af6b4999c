#include "WorkerPool.h"
#include "LoggingChannels.h"

#include <algorithm>

namespace DiceTune {

int resolveWorkerCount(int requested, int reservedCores)
{
    if (requested > 0) {
        return requested;
    }

    const unsigned int cores = std::thread::hardware_concurrency();
    int resolved = cores > 0 ? static_cast<int>(cores) - std::max(0, reservedCores) : 1;
    return std::max(1, resolved);
}

WorkerPool::WorkerPool(int workerCount)
{
    const int count = std::max(1, workerCount);
    workers_.reserve(count);
    for (int i = 0; i < count; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
    LOG_DEBUG(Pool, "WorkerPool: started {} workers", count);
}

WorkerPool::~WorkerPool()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    taskCv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::run(size_t taskCount, const std::function<void(size_t)>& task)
{
    if (taskCount == 0) {
        return;
    }

    std::exception_ptr failure;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        batch_ = Batch{ .task = &task, .remaining = taskCount, .failedIndex = 0, .failure = {} };
        for (size_t i = 0; i < taskCount; ++i) {
            queue_.push_back(i);
        }
        taskCv_.notify_all();

        // Barrier: the batch owns references into the caller's frame until every task is done.
        doneCv_.wait(lock, [this]() { return batch_.remaining == 0; });

        failure = batch_.failure;
        batch_ = Batch{};
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

void WorkerPool::workerLoop()
{
    while (true) {
        size_t index = 0;
        const std::function<void(size_t)>* task = nullptr;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            taskCv_.wait(lock, [this]() { return stopRequested_ || !queue_.empty(); });
            if (stopRequested_ && queue_.empty()) {
                return;
            }
            index = queue_.front();
            queue_.pop_front();
            task = batch_.task;
        }

        std::exception_ptr error;
        try {
            (*task)(index);
        }
        catch (...) {
            // Captured here, rethrown on the submitting thread by run().
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (error && (!batch_.failure || index < batch_.failedIndex)) {
                batch_.failure = error;
                batch_.failedIndex = index;
            }
            batch_.remaining--;
            if (batch_.remaining == 0) {
                doneCv_.notify_all();
            }
        }
    }
}

} // namespace DiceTune
