//===----------------------------------------------------------------------===//
//                         DBRelay
//
// executor/executor_pool.cpp
//
// Worker threads that run session calls
//===----------------------------------------------------------------------===//

#include "executor/executor_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace dbrelay {

ExecutorPool::ExecutorPool(size_t thread_count)
    : thread_count_(thread_count) {
    if (thread_count_ == 0) {
        thread_count_ = std::max<size_t>(std::thread::hardware_concurrency(), 1);
    }
}

ExecutorPool::~ExecutorPool() {
    Stop();
}

void ExecutorPool::Start() {
    if (running_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    threads_.reserve(thread_count_);
    for (size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back(&ExecutorPool::WorkerLoop, this, i);
    }

    LOG_INFO("executor_pool", "Started " + std::to_string(thread_count_) + " workers");
}

size_t ExecutorPool::Stop() {
    if (!running_) {
        return 0;
    }

    std::deque<Task> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        dropped.swap(queue_);
    }
    wakeup_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    running_ = false;

    if (dropped.empty()) {
        LOG_INFO("executor_pool", "Workers stopped");
    } else {
        LOG_WARN("executor_pool", "Workers stopped, " + std::to_string(dropped.size()) +
                 " queued calls dropped");
    }
    return dropped.size();
}

bool ExecutorPool::Submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    wakeup_.notify_one();
    return true;
}

size_t ExecutorPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ExecutorPool::WorkerLoop(size_t index) {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wakeup_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        active_++;
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("executor_pool", "Worker " + std::to_string(index) + " task threw: " + e.what());
        }
        active_--;
    }
}

} // namespace dbrelay
