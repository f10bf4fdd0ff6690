//===----------------------------------------------------------------------===//
//                         DBRelay
//
// executor/serial_queue.hpp
//
// FIFO of tasks that run one at a time on the executor pool
//===----------------------------------------------------------------------===//

#pragma once

#include "executor/executor_pool.hpp"
#include <deque>

namespace dbrelay {

// Each session owns one queue, so its calls apply in issue order while
// different sessions run in parallel.
class SerialQueue : public std::enable_shared_from_this<SerialQueue> {
public:
    using Task = ExecutorPool::Task;

    explicit SerialQueue(ExecutorPool& pool_p) : pool(pool_p) {}

    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    // Returns false once the queue is closed or the pool is stopping
    bool Post(Task task);

    // Refuse further tasks; queued ones still run
    void Close();

    size_t Pending() const;
    bool IsIdle() const;

private:
    // Schedules RunNext on the pool; caller holds the mutex
    bool ScheduleLocked();
    void RunNext();

    ExecutorPool& pool;
    std::deque<Task> tasks;
    bool running = false;
    bool closed = false;
    mutable std::mutex mutex;
};

} // namespace dbrelay
